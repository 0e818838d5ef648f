#pragma once

// Logger.hpp — Boost.Log: console + rotating file sink, channel-tagged macros LOG*.
//
//  Logger::Options opts;
//  Logger::Guard   lg(opts);
//  LOGI("routes") << "Added " << cidr;

#include <cstddef>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace Logger
{
    using Severity      = boost::log::trivial::severity_level;
    using ChannelLogger = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    struct Options
    {
        std::string app_name      = "SplitRoute";
        std::string directory     = "logs";
        std::string base_filename = "splitroute";

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::info;

        std::size_t rotation_size_mb = 10;
        std::size_t max_files        = 5;

        bool to_console = true;
        bool to_file    = true;
    };

    /**
     * @brief RAII: installs the sinks in the constructor, flushes and removes them in the destructor.
     *
     * Without a Guard, records go to the Boost.Log default sink (stderr, unfiltered).
     */
    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        bool file_ok_ = false;
    };

    // Process-wide logger used by the LOG* macros.
    ChannelLogger &Get();

    // Parse "trace|debug|info|warning|error|fatal"; unknown strings map to info.
    Severity SeverityFromString(const std::string &s);
}

#define LOG_CH_SEV_(ch, sev) BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(ch), (sev))

#define LOGT(ch) LOG_CH_SEV_(ch, ::boost::log::trivial::trace)
#define LOGD(ch) LOG_CH_SEV_(ch, ::boost::log::trivial::debug)
#define LOGI(ch) LOG_CH_SEV_(ch, ::boost::log::trivial::info)
#define LOGW(ch) LOG_CH_SEV_(ch, ::boost::log::trivial::warning)
#define LOGE(ch) LOG_CH_SEV_(ch, ::boost::log::trivial::error)
