/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file JsonRpcFramer.h
 * @brief Split a stream of concatenated JSON values
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_JSONRPCFRAMER_H
#define OVNPOLICY_JSONRPCFRAMER_H

#include <cstddef>
#include <deque>
#include <string>

namespace ovnpolicy {

/**
 * OVSDB messages are JSON objects written back to back with no
 * delimiter.  The framer consumes bytes as they arrive and yields each
 * complete top-level value, using the rapidjson parser to find where a
 * value ends.  An incomplete value stays buffered until more bytes
 * arrive.
 */
class JsonRpcFramer {
public:
    JsonRpcFramer();

    /**
     * Consume bytes from the stream
     *
     * @param data the bytes
     * @param len number of bytes
     * @throws std::runtime_error if the stream is not valid JSON or
     * the buffered message grows past the size limit
     */
    void feed(const char* data, std::size_t len);

    /**
     * Check whether a complete message is available
     */
    bool hasMessage() const {
        return !messages.empty();
    }

    /**
     * Take the oldest complete message
     */
    std::string nextMessage();

    /**
     * Discard partial and complete messages
     */
    void reset();

    /**
     * Upper bound on the size of one message
     */
    static const std::size_t MAX_MESSAGE_SIZE;

private:
    std::deque<std::string> messages;
    std::string pending;
};

} /* namespace ovnpolicy */

#endif //OVNPOLICY_JSONRPCFRAMER_H
