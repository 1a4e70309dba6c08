#ifndef BGPCTL_HPP
#define BGPCTL_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli.hpp"

using cmd_args = std::map<std::string,std::string>;
using cmd_callback = std::function<CLI_MSG( const cmd_args & )>;

enum class CLINodeType {
    BEGIN,
    STATIC,
    ARGUMENT,
    END
};

struct CLINode {
    explicit CLINode( CLINodeType t ):
        type( t )
    {}

    explicit CLINode( CLINodeType t, std::string tok ):
        type( t ),
        token( std::move( tok ) )
    {}

    explicit CLINode( CLINodeType t, cmd_callback cb ):
        type( t ),
        callback( std::move( cb ) )
    {}

    CLINode() = delete;

    CLINodeType type;
    // keyword for STATIC nodes, argument name for ARGUMENT nodes
    std::string token;
    cmd_callback callback;

    std::vector<std::shared_ptr<CLINode>> next_nodes;
};

// Command tree. "<name>" in a command template is an argument slot.
class CLICMD {
public:
    CLICMD();
    void add_cmd( const std::string &full_command, cmd_callback callback );
    // Throws std::runtime_error on unknown or incomplete commands
    CLI_MSG call_cmd( const std::string &cmd ) const;
    bool is_exit( const std::string &cmd ) const;

private:
    std::shared_ptr<CLINode> start_node;
};

std::vector<std::string> split( const std::string &input );

// Prints a response, returns false when it carried an error
bool print_resp( std::ostream &os, const CLI_MSG &msg );

struct bgpctl_args {
    std::string socket_path;
    std::vector<std::string> command;
    bool help { false };
};

// Throws boost::program_options::error on bad arguments. The socket path has no default.
bgpctl_args parse_bgpctl_args( int argc, const char *const argv[] );
std::string bgpctl_usage();

#endif
