/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include <boost/filesystem.hpp>

namespace grove {

    /**
     * Routes all native log output to <logdir>/grove.log for the lifetime
     * of the manager. The previous sink (stderr) is restored on destruction.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir, bool append = true) : _append(append), _file(0) {
            if(logdir.empty())
                throw std::invalid_argument("LogManager: empty log directory");

            boost::filesystem::path dir(logdir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if(ec)
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());

            _path = (dir / "grove.log").string();
            start();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if(_file)
                fclose(_file);
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

    private:
        void start() {
            bool exists = boost::filesystem::exists(_path);

            FILE* f = fopen( _path.c_str() , _append ? "a" : "w" );
            if ( ! f ) {
                if (boost::filesystem::is_directory(_path))
                    throw std::runtime_error("logpath [" + _path + "] should be a file name not a directory");
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists){
                // two blank lines before and after
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if(fwrite(msg.data(), 1, msg.size(), f) != msg.size()) {
                    int x = errno;
                    fclose(f);
                    throw std::runtime_error("can't write to [" + _path + "]: " + errnoWithDescription(x));
                }
            }

            _file = f;
            Logger::setLogFile(_file); // after this point no thread will be using the old sink
        }

        string _path;
        bool _append;
        FILE *_file;
    };

    /**
     * Creates a LogManager when GROVE_LOG_DIR is set, nullptr otherwise.
     */
    inline std::unique_ptr<LogManager> initFileLoggingFromEnv() {
        const char* dir = std::getenv("GROVE_LOG_DIR");
        if (!dir || !*dir)
            return std::unique_ptr<LogManager>();
        return std::unique_ptr<LogManager>(new LogManager(dir));
    }
}
