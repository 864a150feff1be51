/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of the JSON stream framer
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "JsonRpcFramer.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <stdexcept>

namespace ovnpolicy {

const std::size_t JsonRpcFramer::MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

// string escape errors are reported at the backslash, up to a
// "\uXXXX\uXXXX" surrogate pair before the end of the input
static const std::size_t ESCAPE_WINDOW = 12;

JsonRpcFramer::JsonRpcFramer() {}

void JsonRpcFramer::reset() {
    messages.clear();
    pending.clear();
}

std::string JsonRpcFramer::nextMessage() {
    if (messages.empty())
        throw std::out_of_range("No complete message");
    std::string msg = std::move(messages.front());
    messages.pop_front();
    return msg;
}

void JsonRpcFramer::feed(const char* data, std::size_t len) {
    pending.append(data, len);

    std::size_t offset = 0;
    while (true) {
        offset = pending.find_first_not_of(" \t\r\n", offset);
        if (offset == std::string::npos) {
            offset = pending.size();
            break;
        }
        if (pending[offset] != '{' && pending[offset] != '[') {
            reset();
            throw std::runtime_error("Unexpected data between JSON-RPC "
                                     "messages");
        }

        const std::size_t remaining = pending.size() - offset;
        rapidjson::Document doc;
        rapidjson::StringStream is(pending.c_str() + offset);
        doc.ParseStream<rapidjson::kParseStopWhenDoneFlag>(is);
        if (doc.HasParseError()) {
            std::size_t errOffset = doc.GetErrorOffset();
            if (errOffset + ESCAPE_WINDOW >= remaining)
                break;
            rapidjson::ParseErrorCode e = doc.GetParseError();
            reset();
            throw std::runtime_error(std::string("Invalid JSON-RPC message: ") +
                                     rapidjson::GetParseError_En(e) +
                                     " at offset " +
                                     std::to_string(errOffset));
        }
        messages.push_back(pending.substr(offset, is.Tell()));
        offset += is.Tell();
    }
    pending.erase(0, offset);

    if (pending.size() > MAX_MESSAGE_SIZE) {
        reset();
        throw std::runtime_error("JSON-RPC message exceeds size limit");
    }
}

} /* namespace ovnpolicy */
