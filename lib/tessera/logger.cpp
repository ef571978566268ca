/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tessera/logger.hpp>

namespace tessera::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("TESSERA_DEBUG") != nullptr;
        return enabled;
    }

    static std::optional<std::string> log_path()
    {
        if (const char *env_log_path = std::getenv("TESSERA_LOG"); env_log_path)
            return std::string { env_log_path };
        return {};
    }

    static bool console_enabled()
    {
        return !std::getenv("TESSERA_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::optional<std::string> &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (path) {
            {
                std::ofstream os { *path, std::ios_base::app };
                if (!os) {
                    std::cerr << fmt::format("TESSERA_INIT: Unable to write to the log file: {}; terminating.\n", *path);
                    std::terminate();
                }
            }
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        if (sinks.empty())
            sinks.emplace_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        spdlog::logger logger { "tessera", sinks.begin(), sinks.end() };
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    static spdlog::level::level_enum native_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw tessera::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    struct capture::impl {
        static constexpr size_t max_messages = 0x400;
        std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(max_messages);
    };

    capture::capture(const level min_lev): _impl { std::make_unique<impl>() }
    {
        _impl->sink->set_level(native_level(min_lev));
        _impl->sink->set_pattern("[%l] %v");
        get().sinks().emplace_back(_impl->sink);
    }

    capture::~capture()
    {
        auto &sinks = get().sinks();
        const spdlog::sink_ptr my_sink = _impl->sink;
        std::erase(sinks, my_sink);
    }

    std::vector<std::string> capture::messages() const
    {
        return _impl->sink->last_formatted();
    }

    void log(level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error:
                get().error(msg);
                break;
            default:
                throw tessera::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
