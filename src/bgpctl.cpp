#include <iostream>
#include <string>
#include <boost/algorithm/string/join.hpp>

#include "types.hpp"
#include "bgpctl.hpp"
#include "cli.hpp"

inline constexpr char greeting[] { "bgpctl# " };

static bool process_input( CLIClientConnection &conn, const CLICMD &cmd, const std::string &input ) {
    try {
        auto resp = conn.request( cmd.call_cmd( input ) );
        return print_resp( std::cout, resp );
    } catch( std::exception &e ) {
        std::cout << "Error: " << e.what() << std::endl;
        return false;
    }
}

int main( int argc, char *argv[] ) {
    bgpctl_args args;
    try {
        args = parse_bgpctl_args( argc, argv );
    } catch( std::exception &e ) {
        std::cerr << e.what() << std::endl << bgpctl_usage() << std::endl;
        return 1;
    }

    if( args.help ) {
        std::cout << bgpctl_usage() << "\n";
        return 0;
    }

    CLICMD cmd;
    try {
        io_context io;
        CLIClientConnection conn { io, args.socket_path };

        if( !args.command.empty() ) {
            auto input = boost::algorithm::join( args.command, " " );
            if( cmd.is_exit( input ) ) {
                return 0;
            }
            return process_input( conn, cmd, input ) ? 0 : 1;
        }

        std::string line;
        std::cout << greeting << std::flush;
        while( std::getline( std::cin, line ) ) {
            if( cmd.is_exit( line ) ) {
                break;
            }
            if( !split( line ).empty() ) {
                process_input( conn, cmd, line );
            }
            std::cout << greeting << std::flush;
        }
    } catch( std::exception &e ) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
