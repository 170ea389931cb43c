/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CLogger_h
#define INCLUDED_mxfar_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/LogMacros.h>

#include <boost/log/attributes/attribute_name.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <functional>
#include <iosfwd>
#include <string>

namespace mxfar {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through the macros
//! in LogMacros.h.
//!
//! Problems which mean the results may be degraded, for example a grid
//! cell for which no local fit was possible, are logged at WARN or
//! below. Problems after which the program can't continue are logged
//! with LOG_FATAL, which does not change program flow by itself.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default records at DEBUG and above go to stderr. The logger can
//! be reconfigured from a Boost.Log settings file.
class CLogger : private CNonCopyable {
public:
    using TFatalErrorHandler = std::function<void(std::string)>;

    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

    //! \brief Sets the fatal error handler for the object lifetime.
    class CScopeSetFatalErrorHandler : private CNonCopyable {
    public:
        explicit CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler);
        ~CScopeSetFatalErrorHandler();

    private:
        TFatalErrorHandler m_OriginalFatalErrorHandler;
    };

public:
    //! Access to singleton - use MACROS to get to this when logging
    static CLogger& instance();

    //! Reconfigure from \p propertiesFile if it is non-empty.
    bool reconfigure(const std::string& propertiesFile);

    //! Reconfigure from the Boost.Log settings in \p propertiesFile.
    bool reconfigureFromFile(const std::string& propertiesFile);

    //! Reconfigure from Boost.Log settings read from \p settingsStrm.
    bool reconfigureFromSettings(std::istream& settingsStrm);

    //! Set the logging level on the fly.
    bool setLoggingLevel(ELevel level);

    //! Get the current logging level.
    ELevel loggingLevel() const;

    //! Map the level enum to a string.
    static const std::string& levelToString(ELevel level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Throw a fatal exception
    [[noreturn]] static void fatal();

    //! Register a new global fatal error handler.
    //!
    //! \note This is not thread safe: call it once at the start of main
    //! or from single threaded test code.
    void fatalErrorHandler(const TFatalErrorHandler& handler);

    //! Get the current fatal error handler.
    const TFatalErrorHandler& fatalErrorHandler() const;

    //! Handle a fatal problem using the registered fatal error handler.
    void handleFatal(std::string message);

    //! \name Attribute Names
    //@{
    boost::log::attribute_name fileAttributeName() const;
    boost::log::attribute_name lineAttributeName() const;
    boost::log::attribute_name functionAttributeName() const;
    //@}

    //! Restore the default configuration. This is mainly for unit tests
    //! since there is only one instance.
    void reset();

private:
    CLogger();
    ~CLogger();

    //! Install the default stderr sink at the current level.
    void installDefaultSink();

    //! The default fatal error handler exits the process with an error status.
    [[noreturn]] static void defaultFatalErrorHandler(std::string message);

private:
    TLevelSeverityLogger m_Logger;
    ELevel m_Level;
    bool m_Reconfigured;
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    boost::log::attribute_name m_FunctionAttributeName;
    TFatalErrorHandler m_FatalErrorHandler;
};

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);
std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_mxfar_core_CLogger_h
