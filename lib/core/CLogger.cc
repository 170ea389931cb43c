/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace mxfar {
namespace core {
namespace {
const std::array<std::string, 6> LEVEL_NAMES{"TRACE", "DEBUG", "INFO",
                                              "WARN",  "ERROR", "FATAL"};
const std::string UNKNOWN_LEVEL{"UNKNOWN"};

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", CLogger::ELevel)
BOOST_LOG_ATTRIBUTE_KEYWORD(line, "Line", int)
BOOST_LOG_ATTRIBUTE_KEYWORD(timeStamp, "TimeStamp", boost::posix_time::ptime)

using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

std::once_flag registerFactoriesOnce;

//! Allow Severity to appear in filters and formats of settings files.
void registerSettingsFactories() {
    std::call_once(registerFactoriesOnce, [] {
        boost::log::register_simple_filter_factory<CLogger::ELevel, char>("Severity");
        boost::log::register_simple_formatter_factory<CLogger::ELevel, char>("Severity");
    });
}
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

CLogger::CLogger()
    : m_Level{E_Debug}, m_Reconfigured{false}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    this->installDefaultSink();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

void CLogger::installDefaultSink() {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    auto sink = boost::make_shared<TTextSink>();
    sink->locked_backend()->add_stream(
        boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    sink->locked_backend()->auto_flush(true);
    sink->set_formatter(boost::log::expressions::stream
                        << boost::log::expressions::format_date_time(
                               timeStamp, "%Y-%m-%d %H:%M:%S,%f")
                        << ' ' << severity << " [" << line << "] "
                        << boost::log::expressions::smessage);
    core->add_sink(sink);
    core->set_filter(severity >= m_Level);
}

bool CLogger::reconfigure(const std::string& propertiesFile) {
    if (propertiesFile.empty()) {
        // Nothing to do: keep logging to stderr.
        return true;
    }
    return this->reconfigureFromFile(propertiesFile);
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open logger properties file " << propertiesFile);
        return false;
    }
    if (this->reconfigureFromSettings(strm) == false) {
        LOG_ERROR(<< "Failed to reconfigure logger from " << propertiesFile);
        return false;
    }
    LOG_DEBUG(<< "Logger reconfigured from " << propertiesFile);
    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    registerSettingsFactories();
    auto core = boost::log::core::get();
    core->remove_all_sinks();
    core->reset_filter();
    try {
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        this->installDefaultSink();
        LOG_ERROR(<< "Invalid logger settings: " << e.what());
        return false;
    }
    m_Reconfigured = true;
    return true;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        LOG_ERROR(<< "Unexpected logging level " << static_cast<int>(level));
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(severity >= m_Level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN_LEVEL;
    }
    return LEVEL_NAMES[static_cast<std::size_t>(level)];
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error{"Fatal exception"};
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

void CLogger::reset() {
    m_Level = E_Debug;
    m_Reconfigured = false;
    m_FatalErrorHandler = defaultFatalErrorHandler;
    this->installDefaultSink();
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    std::cerr << message << std::endl;
    std::exit(EXIT_FAILURE);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    strm >> name;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto i = std::find(LEVEL_NAMES.begin(), LEVEL_NAMES.end(), name);
    if (i == LEVEL_NAMES.end()) {
        strm.setstate(std::ios_base::failbit);
    } else {
        level = static_cast<CLogger::ELevel>(i - LEVEL_NAMES.begin());
    }
    return strm;
}
}
}
