/*
 * PhishShape - Compression-Distance Phishing Classifier
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * PhishShape — Tool Support
 * ============================================================================
 *
 * @file ToolSupport.hpp
 * @brief Console logger setup shared by the command line tools
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "../Utils/Logger.hpp"


namespace PhishShape::Tools {

    /**
     * @brief Synchronous console logger for the lifetime of a tool run.
     */
    class ConsoleLogSession final {
    public:
        explicit ConsoleLogSession(bool verbose) {
            Utils::LoggerConfig cfg{};
            cfg.async = false;
            cfg.toConsole = true;
            cfg.toFile = false;
            cfg.includeSrcLocation = false;
            cfg.includeThreadId = false;
            cfg.minimalLevel = verbose ? Utils::LogLevel::Debug : Utils::LogLevel::Info;
            Utils::Logger::Instance().Initialize(cfg);
        }

        ~ConsoleLogSession() {
            Utils::Logger::Instance().ShutDown();
        }

        ConsoleLogSession(const ConsoleLogSession&) = delete;
        ConsoleLogSession& operator=(const ConsoleLogSession&) = delete;
    };

    /// Exit codes shared by every tool
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitFailure = 1;
    inline constexpr int kExitUsage = 2;

} // namespace PhishShape::Tools
