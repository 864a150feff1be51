/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Command line tool for translating and applying security groups
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "NorthboundClient.h"
#include <ovnpolicy/AclTranslator.h>
#include <ovnpolicy/DomainReader.h>
#include <ovnpolicy/Errors.h>
#include <ovnpolicy/NorthboundConfig.h>
#include <ovnpolicy/SecurityGroupPresets.h>
#include <ovnpolicy/logging.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <memory>

using std::string;
using std::vector;
namespace po = boost::program_options;
namespace pt = boost::property_tree;
using namespace ovnpolicy;

static void readConfig(NorthboundConfig& config, const string& configFile) {
    pt::ptree properties;

    LOG(INFO) << "Reading configuration from " << configFile;
    try {
        DomainReader::readJsonFile(configFile, properties);
    } catch (pt::json_parser_error& e) {
        LOG(ERROR) << "Error parsing config file: " << configFile << "("
                   << e.line() << "): " << e.message();
        throw;
    }
    config.setProperties(properties);
}

static SecurityGroup readGroup(const string& file) {
    pt::ptree properties;
    DomainReader::readJsonFile(file, properties);
    return DomainReader::readSecurityGroup(properties);
}

static void printResult(const TranslationResult& result) {
    std::cout << "Port group " << result.portGroup.name << " ("
              << result.acls.size() << " ACLs)" << std::endl;
    for (const Acl& acl : result.acls)
        std::cout << "  " << acl << std::endl;
    for (const SkippedRule& skipped : result.skipped)
        std::cout << "  skipped rule " << skipped.ruleId << ": "
                  << skipped.reason << std::endl;
}

static int translate(const string& file) {
    auto sg = std::make_shared<SecurityGroup>(readGroup(file));
    AclTranslator translator(std::make_shared<RandomIdGenerator>());
    printResult(translator.translateSecurityGroup(sg));
    return 0;
}

static int presets() {
    for (const SecurityGroupPreset& preset : getPresets()) {
        std::cout << preset.name << ": " << preset.description << std::endl;
        for (const SecurityGroupRule& rule : preset.rules)
            std::cout << "  " << rule << std::endl;
    }
    return 0;
}

static int apply(const NorthboundConfig& config, const string& file) {
    auto sg = std::make_shared<SecurityGroup>(readGroup(file));
    NorthboundClient client(config);
    if (client.isMockMode())
        std::cerr << "Warning: northbound database unreachable; "
                  << "changes are not persisted" << std::endl;
    printResult(client.createSecurityGroupAcls(sg));
    client.close();
    return 0;
}

static int deleteGroup(const NorthboundConfig& config, const string& sgId) {
    NorthboundClient client(config);
    if (client.isMockMode())
        std::cerr << "Warning: northbound database unreachable; "
                  << "changes are not persisted" << std::endl;
    client.deleteSecurityGroupAcls(sgId);
    client.close();
    return 0;
}

int main(int argc, char** argv) {
    // Parse command line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Print this help message")
        ("config,c", po::value<string>(),
         "Read northbound configuration from the specified file")
        ("log-level", po::value<string>(),
         "Use the specified log level (default info). "
         "Overrides the log level in the configuration file")
        ("log-file", po::value<string>(),
         "Log to the specified file (default standard out)")
        ("syslog", "Log to syslog instead of file or standard out");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<string>(), "command")
        ("args", po::value<vector<string> >(), "command arguments");
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    const string usage = string("Usage: ") + argv[0] +
        " [options] <command> [args]\n"
        "Commands:\n"
        "  translate <security-group.json>  print the generated ACLs\n"
        "  presets                          list security group presets\n"
        "  apply <security-group.json>      store a security group's ACLs\n"
        "  delete <sg-id>                   remove a security group's ACLs\n";

    po::variables_map vm;
    string command;
    vector<string> args;
    try {
        po::store(po::command_line_parser(argc, argv).
                  options(all).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << usage << desc;
            return 0;
        }
        if (!vm.count("command")) {
            std::cerr << usage << desc;
            return 1;
        }
        command = vm["command"].as<string>();
        if (vm.count("args"))
            args = vm["args"].as<vector<string> >();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    size_t nargs = command == "presets" ? 0 : 1;
    if ((command != "translate" && command != "presets" &&
         command != "apply" && command != "delete") ||
        args.size() != nargs) {
        std::cerr << usage;
        return 1;
    }

    NorthboundConfig config;
    try {
        if (vm.count("config"))
            readConfig(config, vm["config"].as<string>());
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    string level = vm.count("log-level")
        ? vm["log-level"].as<string>() : config.getLogLevel();
    string logFile = vm.count("log-file")
        ? vm["log-file"].as<string>() : config.getLogFile();
    bool logToSyslog = vm.count("syslog") || config.getLogToSyslog();
    initLogging(level, logToSyslog, logFile, "ovnpolicy_ctl");

    try {
        if (command == "translate")
            return translate(args[0]);
        if (command == "presets")
            return presets();
        if (command == "apply")
            return apply(config, args[0]);
        return deleteGroup(config, args[0]);
    } catch (const pt::ptree_error& e) {
        LOG(ERROR) << "Invalid security group: " << e.what();
    } catch (const TransactionError& e) {
        LOG(ERROR) << "Northbound transaction failed: " << e.getError()
                   << " " << e.getDetails();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to " << command << ": " << e.what();
    }
    return 2;
}
