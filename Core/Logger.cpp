#include "Core/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging  = boost::log;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace
{
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity, "Severity", Logger::Severity)
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,  "Channel",  std::string)

    auto MakeFormatter()
    {
        return expr::stream
               << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
               << "] [" << a_severity
               << "] [" << a_channel
               << "] " << expr::smessage;
    }
}

namespace Logger
{
    ChannelLogger &Get()
    {
        static ChannelLogger lg(keywords::channel = std::string("main"));
        return lg;
    }

    Severity SeverityFromString(const std::string &s)
    {
        if (s == "trace")   return logging::trivial::trace;
        if (s == "debug")   return logging::trivial::debug;
        if (s == "warning") return logging::trivial::warning;
        if (s == "warn")    return logging::trivial::warning;
        if (s == "error")   return logging::trivial::error;
        if (s == "fatal")   return logging::trivial::fatal;
        return logging::trivial::info;
    }

    Guard::Guard(const Options &opts)
    {
        auto core = logging::core::get();
        core->remove_all_sinks();

        logging::add_common_attributes();
        core->add_global_attribute("App", logging::attributes::constant<std::string>(opts.app_name));

        if (opts.to_console)
        {
            logging::add_console_log(
                    std::clog,
                    keywords::format = MakeFormatter(),
                    keywords::filter = a_severity >= opts.console_min_severity,
                    keywords::auto_flush = true);
        }

        if (opts.to_file)
        {
            std::error_code ec;
            std::filesystem::create_directories(opts.directory, ec);
            if (ec)
            {
                std::cerr << "[logger] cannot create log directory " << opts.directory
                          << ": " << ec.message() << "\n";
            }
            else
            {
                const std::filesystem::path dir(opts.directory);
                logging::add_file_log(
                        keywords::file_name     = (dir / (opts.base_filename + "_%Y%m%d_%N.log")).string(),
                        keywords::target        = dir.string(),
                        keywords::rotation_size = opts.rotation_size_mb * 1024 * 1024,
                        keywords::max_files     = opts.max_files,
                        keywords::open_mode     = std::ios_base::app,
                        keywords::format        = MakeFormatter(),
                        keywords::filter        = a_severity >= opts.file_min_severity,
                        keywords::auto_flush    = true);
                file_ok_ = true;
            }
        }

        LOGD("main") << "Logger armed (file=" << (file_ok_ ? opts.directory : std::string("off")) << ")";
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        core->flush();
        core->remove_all_sinks();
    }
}
