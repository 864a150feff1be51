/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Errors.h
 * @brief Exception types raised by the policy compiler and the
 * northbound client
 */
/*
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef OVNPOLICY_ERRORS_H
#define OVNPOLICY_ERRORS_H

#include <stdexcept>
#include <string>

namespace ovnpolicy {

/**
 * A northbound object requested by name or domain id does not exist
 */
class NotFoundError : public std::runtime_error {
public:
    /**
     * @param objectType the kind of object, e.g. "logical switch"
     * @param name the derived northbound name that was looked up
     */
    NotFoundError(const std::string& objectType, const std::string& name)
        : std::runtime_error(objectType + " not found: " + name),
          type(objectType), objectName(name) {}

    /** The kind of object that was not found */
    const std::string& getObjectType() const { return type; }

    /** The northbound name that was looked up */
    const std::string& getName() const { return objectName; }

private:
    std::string type;
    std::string objectName;
};

/**
 * The northbound database could not be reached, or the connection was
 * lost and could not be re-established in time
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * The northbound database rejected a transaction
 */
class TransactionError : public std::runtime_error {
public:
    /**
     * @param error the OVSDB error string, e.g. "constraint violation"
     * @param details free-form details supplied by the server
     */
    TransactionError(const std::string& error, const std::string& details)
        : std::runtime_error(details.empty() ? error : error + ": " + details),
          err(error), det(details) {}

    /** OVSDB error tag */
    const std::string& getError() const { return err; }

    /** Server supplied details */
    const std::string& getDetails() const { return det; }

private:
    std::string err;
    std::string det;
};

/**
 * A single security group rule could not be translated
 */
class TranslationError : public std::runtime_error {
public:
    explicit TranslationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Invalid configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} /* namespace ovnpolicy */

#endif /* OVNPOLICY_ERRORS_H */
