//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include "utility.hpp"

#include <random>
#include <iostream>
#include <stdexcept>

#include <boost/algorithm/string/replace.hpp>
#include <boost/chrono.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/lock_guard.hpp>


namespace kiln
{
    namespace
    {
        boost::mutex log_mutex;

        auto severity_mark( severity const level )
            -> char const*
        {
            switch( level ) {
            case severity::info:
                return "[+] ";
            case severity::warn:
                return "[!] ";
            case severity::error:
                return "[-] ";
            }

            return "[?] ";
        }
    }

    log_line::log_line( severity const level )
        : level_( level )
    {}

    log_line::~log_line()
    {
        try {
            auto const line = severity_mark( level_ ) + ss_.str() + "\n";

            boost::lock_guard<boost::mutex> lock( log_mutex );
            std::clog << line << std::flush;

        } catch( std::exception const& ) {
            // logging failures are ignored
        }
    }


    auto make_random_name( std::size_t const length )
        -> std::string
    {
        static char const BaseChars[] = "abcdefghijklmnopqrstuvwxyz1234567890";

        thread_local auto gen = std::mt19937( std::random_device{}() );
        auto dist = std::uniform_int_distribution<int>{
            0,
            sizeof(BaseChars) / sizeof(char) - 1 /*term*/ -1 /*closed-interval*/
        };

        std::string name( length, '\0' );
        for( auto& c : name ) {
            c = BaseChars[dist(gen)];
        }

        return name;
    }

    auto make_execution_id()
        -> std::string
    {
        auto const millis = boost::chrono::duration_cast<boost::chrono::milliseconds>(
            boost::chrono::system_clock::now().time_since_epoch()
            ).count();

        std::stringstream ss;
        ss << "exec-" << millis << "-" << make_random_name( 10 );
        return ss.str();
    }

    auto split_command_line( std::string const& line )
        -> std::vector<std::string>
    {
        enum class state { blank, word, single_quoted, double_quoted };

        std::vector<std::string> words;
        std::string current;
        auto st = state::blank;

        for( std::size_t i=0; i<line.size(); ++i ) {
            char const c = line[i];

            switch( st ) {
            case state::blank:
            case state::word:
                if ( c == ' ' || c == '\t' || c == '\n' ) {
                    if ( st == state::word ) {
                        words.push_back( std::move( current ) );
                        current.clear();
                    }
                    st = state::blank;

                } else if ( c == '\'' ) {
                    st = state::single_quoted;

                } else if ( c == '"' ) {
                    st = state::double_quoted;

                } else if ( c == '\\' ) {
                    if ( i + 1 < line.size() ) {
                        current += line[++i];
                    }
                    st = state::word;

                } else {
                    current += c;
                    st = state::word;
                }
                break;

            case state::single_quoted:
                if ( c == '\'' ) {
                    st = state::word;
                } else {
                    current += c;
                }
                break;

            case state::double_quoted:
                if ( c == '"' ) {
                    st = state::word;

                } else if ( c == '\\' && i + 1 < line.size()
                            && ( line[i+1] == '"' || line[i+1] == '\\' || line[i+1] == '$' || line[i+1] == '`' ) ) {
                    current += line[++i];

                } else {
                    current += c;
                }
                break;
            }
        }

        if ( st == state::single_quoted || st == state::double_quoted ) {
            throw std::runtime_error( "unterminated quote in command: " + line );
        }

        if ( st == state::word ) {
            words.push_back( std::move( current ) );
        }

        return words;
    }

    auto shell_quote( std::string const& value )
        -> std::string
    {
        return "'" + boost::algorithm::replace_all_copy( value, "'", "'\\''" ) + "'";
    }

} // namespace kiln
