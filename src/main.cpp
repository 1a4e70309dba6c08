#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>
#include "yaml.hpp"

#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "supervisor.hpp"
#include "cli.hpp"

static void conf_init() {
    global_conf conf;

    conf.listen_address = boost::asio::ip::make_address_v4( "0.0.0.0" );
    conf.my_as = 65001;
    conf.bgp_router_id = boost::asio::ip::make_address_v4( "10.0.0.1" );
    // one socket per instance
    conf.control_socket = "/var/run/bgpcpd-"s + conf.bgp_router_id.to_string() + ".sock";
    conf.networks.push_back( boost::asio::ip::make_network_v4( "10.1.0.0/24" ) );
    conf.networks.push_back( boost::asio::ip::make_network_v4( "192.0.2.0/24" ) );

    {
        bgp_neighbour_v4 nei;
        nei.address = boost::asio::ip::make_address_v4( "10.0.0.2" );
        nei.remote_as = 65002;
        conf.neighbours.push_back( std::move( nei ) );
    }

    {
        bgp_neighbour_v4 nei;
        nei.address = boost::asio::ip::make_address_v4( "10.0.0.3" );
        nei.remote_as = 65001;
        nei.hold_time.emplace( 90 );
        nei.passive = true;
        conf.neighbours.push_back( std::move( nei ) );
    }

    YAML::Node config;
    config = conf;

    std::ofstream fout( "config.yaml" );
    fout << config << std::endl;
}

int main( int argc, char *argv[] ) {
    std::string path_config { "config.yaml" };

    boost::program_options::options_description desc {
        "BGP-4 control plane daemon.\n"
        "Speaks IPv4 unicast BGP with the configured neighbours and answers queries from bgpctl on the control socket. "
        "All configuration is available through config file. You can generate sample configuration to see all the parameters.\n"
        "\n"
        "Arguments"
    };
    desc.add_options()
    ( "path,p", boost::program_options::value( &path_config ), "Path to config: default is \"config.yaml\"" )
    ( "genconf,g", "Generate a sample configuration" )
    ( "help,h", "Print this message" )
    ;

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store( boost::program_options::parse_command_line( argc, argv, desc ), vm );
        boost::program_options::notify( vm );
    } catch( std::exception &e ) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if( vm.count( "help" ) ) {
        std::cout << desc << "\n";
        return 0;
    }

    if( vm.count( "genconf" ) ) {
        conf_init();
        return 0;
    }

    global_conf conf;
    try {
        conf = load_config( path_config );
    } catch( std::exception &e ) {
        logger->logError() << LOGS::CONF << "Can't load config " << path_config << ": " << e.what() << std::endl;
        return 1;
    }
    logger->setLevel( conf.log_level );

    try {
        io_context io;

        bgp_supervisor supervisor { io, conf };

        std::remove( conf.control_socket.c_str() );
        CLIServer cli { io, conf.control_socket, [ &supervisor ]( const CLI_MSG &req, cli_reply reply ) {
            supervisor.handle_cli( req, std::move( reply ) );
        }};

        boost::asio::signal_set signals { io, SIGINT, SIGTERM };
        signals.async_wait( [ &supervisor ]( const error_code &ec, int signum ) {
            if( ec ) {
                return;
            }
            logger->logInfo() << LOGS::MAIN << "Caught signal " << signum << std::endl;
            supervisor.shutdown();
        });

        supervisor.start();

        std::vector<std::thread> workers;
        for( uint16_t i = 1; i < conf.threads; i++ ) {
            workers.emplace_back( [ &io ]() { io.run(); } );
        }
        io.run();
        for( auto &w: workers ) {
            w.join();
        }
    } catch( std::exception &e ) {
        logger->logError() << LOGS::MAIN << "Fatal: " << e.what() << std::endl;
        std::remove( conf.control_socket.c_str() );
        return 1;
    }

    std::remove( conf.control_socket.c_str() );
    logger->logInfo() << LOGS::MAIN << "Stopped" << std::endl;
    return 0;
}
