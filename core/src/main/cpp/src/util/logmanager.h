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
#include <fcntl.h>
#include <boost/filesystem.hpp>

namespace statuslist {

    /**
     * Owns the process log file. Until a LogManager is started all output
     * goes to stderr.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logpath="") : _enabled(false), _append(true), _file(0) {
            string lp;
            if(!logpath.empty()) {
                lp = logpath + "/statuslist.log";
            }
            else {
                const char* home = getenv("STATUSLIST_HOME");
                lp = string(home ? home : ".") + "/logs/statuslist.log";
            }
            start(lp, true);
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(nullptr);
                fclose( _file );
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            strftime(buf, sizeof(buf), fmt, &t);
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            boost::filesystem::path p(lp);
            boost::system::error_code ec;
            if ( p.has_parent_path() )
                boost::filesystem::create_directories(p.parent_path(), ec);

            if (boost::filesystem::is_directory(p)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }

            bool exists = boost::filesystem::exists(p);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists){
                const string msg = "\n\n***** STATUS LIST SERVICE RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        /**
         * Renames the current file to a timestamped name and reopens the
         * original path.
         */
        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
#ifdef POSIX_FADV_DONTNEED
                posix_fadvise(fileno(_file), 0, 0, POSIX_FADV_DONTNEED);
#endif
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                rename( _path.c_str() , s.c_str() );
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file");
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

    private:
        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
