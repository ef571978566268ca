/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/common/test.hpp>
#include <tessera/logger.hpp>

using namespace tessera;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "run_and_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] { return true; });
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
        };
        "run_log_errors_and_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] { return true; }); }));
            expect(throws([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
        "capture"_test = [] {
            std::vector<std::string> msgs {};
            {
                logger::capture cap { logger::level::info };
                logger::debug("captured-debug");
                logger::info("captured-info {}", 1);
                logger::warn("captured-warn");
                msgs = cap.messages();
            }
            test_same(msgs.size(), 2);
            if (msgs.size() == 2) {
                expect(msgs[0].starts_with("[info] captured-info 1")) << msgs[0];
                expect(msgs[1].starts_with("[warn] captured-warn")) << msgs[1];
            }
        };
        "cleanup runs on failure"_test = [] {
            bool cleaned = false;
            const auto ex = logger::run_log_errors([] { throw error("Something bad!"); }, [&] { cleaned = true; });
            expect(static_cast<bool>(ex));
            expect(cleaned);
        };
    };
};
