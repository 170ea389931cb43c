/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

// No include guards: a translation unit may redefine the logging macros.

#include <boost/current_function.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

#ifdef MXFAR_LOG_LOCATION_INFO
#undef MXFAR_LOG_LOCATION_INFO
#endif
#define MXFAR_LOG_LOCATION_INFO                                                \
    << boost::log::add_value(                                                  \
           mxfar::core::CLogger::instance().lineAttributeName(), __LINE__)     \
    << boost::log::add_value(                                                  \
           mxfar::core::CLogger::instance().fileAttributeName(), __FILE__)     \
    << boost::log::add_value(                                                  \
           mxfar::core::CLogger::instance().functionAttributeName(),           \
           BOOST_CURRENT_FUNCTION)

// Log at a level specified at runtime, for example
// LOG_AT_LEVEL(mxfar::core::CLogger::E_Warn, << "Cell " << i << " is empty")
#ifdef LOG_AT_LEVEL
#undef LOG_AT_LEVEL
#endif
#define LOG_AT_LEVEL(level, message)                                           \
    BOOST_LOG_STREAM_SEV(mxfar::core::CLogger::instance().logger(), level)     \
    MXFAR_LOG_LOCATION_INFO                                                    \
    message

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// Expands to code the optimiser removes so per grid cell tracing costs nothing
#define LOG_TRACE(message)                                                     \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Trace, message)
#endif

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Debug, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Info, message)

#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Warn, message)

#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Error, message)

#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message) LOG_AT_LEVEL(mxfar::core::CLogger::E_Fatal, message)

// Route a fatal problem to the registered fatal error handler.
#ifdef HANDLE_FATAL
#undef HANDLE_FATAL
#endif
#define HANDLE_FATAL(message)                                                  \
    {                                                                          \
        std::ostringstream ss;                                                 \
        ss message;                                                            \
        mxfar::core::CLogger::instance().handleFatal(ss.str());                \
    }

// Only for states which are impossible unless the code has a bug.
#ifdef LOG_ABORT
#undef LOG_ABORT
#endif
#define LOG_ABORT(message)                                                     \
    LOG_FATAL(message);                                                        \
    mxfar::core::CLogger::fatal()
