#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include "types.hpp"
#include "bgpctl.hpp"
#include "string_helpers.hpp"

std::vector<std::string> split( const std::string &input ) {
    std::vector<std::string> tokens;
    boost::split( tokens, input, boost::is_any_of( " \t" ) );

    tokens.erase(
        std::remove_if(
            tokens.begin(),
            tokens.end(),
            []( const std::string &i ) {
                return i.empty();
            }
        ),
        tokens.end()
    );

    return tokens;
}

static CLI_MSG make_request( CLI_CMD cmd, const std::string &peer = {} ) {
    CLI_MSG out_msg {};
    out_msg.type = CLI_CMD_TYPE::REQUEST;
    out_msg.cmd = cmd;
    out_msg.peer = peer;
    return out_msg;
}

static std::string peer_arg( const cmd_args &args ) {
    if( auto it = args.find( "peer" ); it != args.end() ) {
        return it->second;
    }
    return {};
}

static CLI_MSG get_version( const cmd_args &args ) {
    return make_request( CLI_CMD::GET_VERSION );
}

static CLI_MSG get_neighbours( const cmd_args &args ) {
    return make_request( CLI_CMD::GET_NEIGHBOURS );
}

static CLI_MSG get_loc_rib( const cmd_args &args ) {
    return make_request( CLI_CMD::GET_LOC_RIB );
}

static CLI_MSG get_received( const cmd_args &args ) {
    return make_request( CLI_CMD::GET_ROUTES_RECEIVED, peer_arg( args ) );
}

static CLI_MSG get_advertised( const cmd_args &args ) {
    return make_request( CLI_CMD::GET_ROUTES_ADVERTISED, peer_arg( args ) );
}

CLICMD::CLICMD():
    start_node( std::make_shared<CLINode>( CLINodeType::BEGIN ) )
{
    add_cmd( "show version", get_version );
    add_cmd( "show neighbours", get_neighbours );
    add_cmd( "show neighbors", get_neighbours );
    add_cmd( "show routes", get_loc_rib );
    add_cmd( "show routes received", get_received );
    add_cmd( "show routes received <peer>", get_received );
    add_cmd( "show routes advertised", get_advertised );
    add_cmd( "show routes advertised <peer>", get_advertised );
}

void CLICMD::add_cmd( const std::string &full_command, cmd_callback callback ) {
    auto node = start_node;

    for( auto const &ntoken: split( full_command ) ) {
        auto type = CLINodeType::STATIC;
        auto name = ntoken;
        if( ntoken.size() > 2 && ntoken.front() == '<' && ntoken.back() == '>' ) {
            type = CLINodeType::ARGUMENT;
            name = ntoken.substr( 1, ntoken.size() - 2 );
        }

        if( auto nnode = std::find_if(
            node->next_nodes.begin(),
            node->next_nodes.end(),
            [ &name, type ]( const std::shared_ptr<CLINode> &v ) -> bool {
                return v->type == type && v->token == name;
            }
        ); nnode != node->next_nodes.end() ) {
            node = *nnode;
        } else {
            node->next_nodes.push_back( std::make_shared<CLINode>( type, name ) );
            node = node->next_nodes.back();
        }
    }
    node->next_nodes.push_back( std::make_shared<CLINode>( CLINodeType::END, std::move( callback ) ) );
}

CLI_MSG CLICMD::call_cmd( const std::string &cmd ) const {
    auto node = start_node;
    cmd_args arguments;

    for( auto const &ntoken: split( cmd ) ) {
        auto &next = node->next_nodes;
        auto nnode = std::find_if( next.begin(), next.end(), [ &ntoken ]( const std::shared_ptr<CLINode> &v ) {
            return v->type == CLINodeType::STATIC && v->token == ntoken;
        });
        if( nnode == next.end() ) {
            nnode = std::find_if( next.begin(), next.end(), []( const std::shared_ptr<CLINode> &v ) {
                return v->type == CLINodeType::ARGUMENT;
            });
            if( nnode == next.end() ) {
                throw std::runtime_error( "Unknown command: "s + cmd );
            }
            arguments.emplace( ( *nnode )->token, ntoken );
        }
        node = *nnode;
    }

    auto end = std::find_if( node->next_nodes.begin(), node->next_nodes.end(), []( const std::shared_ptr<CLINode> &v ) {
        return v->type == CLINodeType::END;
    });
    if( end == node->next_nodes.end() ) {
        throw std::runtime_error( "Incomplete command: "s + cmd );
    }
    return ( *end )->callback( arguments );
}

bool CLICMD::is_exit( const std::string &cmd ) const {
    auto tokens = split( cmd );
    return tokens.size() == 1 && ( tokens.front() == "exit" || tokens.front() == "quit" );
}

bool print_resp( std::ostream &os, const CLI_MSG &msg ) {
    if( !msg.error.empty() ) {
        os << "Error: " << msg.error << std::endl;
        return false;
    }
    switch( msg.cmd ) {
    case CLI_CMD::GET_VERSION: {
        auto resp = deserialize<GET_VERSION_RESP>( msg.data );
        os << resp << std::endl;
        break;
    }
    case CLI_CMD::GET_NEIGHBOURS: {
        auto resp = deserialize<GET_NEIGHBOURS_RESP>( msg.data );
        os << resp;
        break;
    }
    case CLI_CMD::GET_ROUTES_RECEIVED:
    case CLI_CMD::GET_ROUTES_ADVERTISED:
    case CLI_CMD::GET_LOC_RIB: {
        auto resp = deserialize<GET_ROUTES_RESP>( msg.data );
        os << resp;
        break;
    }
    }
    return true;
}

inline constexpr char bgpctl_caption[] {
    "Control utility of the BGP control plane daemon.\n"
    "Runs the given command, or reads commands from stdin when none is given.\n"
    "Commands:\n"
    "  show version\n"
    "  show neighbours\n"
    "  show routes\n"
    "  show routes received [PEER]\n"
    "  show routes advertised [PEER]\n"
    "  exit\n"
    "\n"
    "Arguments"
};

static void add_visible_options( boost::program_options::options_description &desc, bgpctl_args &args ) {
    desc.add_options()
    ( "socket,s", boost::program_options::value( &args.socket_path )->required(), "Path to the daemon control socket, control_socket of its config" )
    ( "help,h", "Print this message" )
    ;
}

bgpctl_args parse_bgpctl_args( int argc, const char *const argv[] ) {
    bgpctl_args args;
    boost::program_options::options_description desc { bgpctl_caption };
    add_visible_options( desc, args );

    boost::program_options::options_description hidden;
    hidden.add_options()
    ( "command", boost::program_options::value( &args.command ) )
    ;
    boost::program_options::options_description all;
    all.add( desc ).add( hidden );

    boost::program_options::positional_options_description positional;
    positional.add( "command", -1 );

    boost::program_options::variables_map vm;
    boost::program_options::store(
        boost::program_options::command_line_parser( argc, argv ).options( all ).positional( positional ).run(), vm );
    if( vm.count( "help" ) ) {
        args.help = true;
        return args;
    }
    boost::program_options::notify( vm );
    return args;
}

std::string bgpctl_usage() {
    bgpctl_args args;
    boost::program_options::options_description desc { bgpctl_caption };
    add_visible_options( desc, args );
    std::ostringstream ss;
    ss << desc;
    return ss.str();
}
