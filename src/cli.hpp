#ifndef CLI_HPP
#define CLI_HPP

#include <array>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

using stream_protocol = boost::asio::local::stream_protocol;

inline constexpr uint32_t CLI_MAX_MSG_LEN { 1024 * 1024 };

enum class CLI_CMD_TYPE: uint8_t {
    REQUEST = 0,
    RESPONSE = 1,
};

enum class CLI_CMD: uint8_t {
    GET_VERSION,
    GET_NEIGHBOURS,
    GET_ROUTES_RECEIVED,
    GET_ROUTES_ADVERTISED,
    GET_LOC_RIB,
};

struct CLI_MSG {
    CLI_CMD_TYPE type;
    CLI_CMD cmd;
    // optional neighbour filter for route listings, empty for all
    std::string peer;
    std::string data;
    std::string error;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & type;
        archive & cmd;
        archive & peer;
        archive & data;
        archive & error;
    }
};

struct NEIGHBOUR_DUMP {
    std::string address;
    uint16_t remote_as;
    std::string state;
    uint64_t time_in_state;
    std::string router_id;
    uint16_t hold_time;
    uint64_t msg_in;
    uint64_t msg_out;
    uint64_t updates_in;
    uint64_t updates_out;
    uint32_t established_count;
    std::string last_error;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & address;
        archive & remote_as;
        archive & state;
        archive & time_in_state;
        archive & router_id;
        archive & hold_time;
        archive & msg_in;
        archive & msg_out;
        archive & updates_in;
        archive & updates_out;
        archive & established_count;
        archive & last_error;
    }
};

struct ROUTE_DUMP {
    // neighbour the route was learned from or advertised to, "local" for originated routes
    std::string peer;
    std::string prefix;
    std::string next_hop;
    std::string as_path;
    std::string origin;
    bool has_local_pref;
    uint32_t local_pref;
    bool has_med;
    uint32_t med;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & peer;
        archive & prefix;
        archive & next_hop;
        archive & as_path;
        archive & origin;
        archive & has_local_pref;
        archive & local_pref;
        archive & has_med;
        archive & med;
    }
};

struct GET_NEIGHBOURS_RESP {
    std::vector<NEIGHBOUR_DUMP> neighbours;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & neighbours;
    }
};

struct GET_ROUTES_RESP {
    std::string table;
    std::vector<ROUTE_DUMP> routes;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & table;
        archive & routes;
    }
};

struct GET_VERSION_RESP {
    std::string version_string;

    template<class Archive>
    void serialize( Archive &archive, const unsigned int version ) {
        archive & version_string;
    }
};

template<typename T>
std::string serialize( const T &val ) {
    static auto const ser_flags = boost::archive::no_header | boost::archive::no_tracking;
    std::stringstream ss;
    boost::archive::binary_oarchive ser( ss, ser_flags );
    ser << val;
    return ss.str();
}

template<typename T>
T deserialize( const std::string &val ) {
    static auto const ser_flags = boost::archive::no_header | boost::archive::no_tracking;
    T out;
    std::istringstream ss( val );
    boost::archive::binary_iarchive deser{ ss, ser_flags };
    deser >> out;
    return out;
}

// 4 byte big-endian length followed by the archive
std::string frame_cli_msg( const CLI_MSG &msg );

// Answers a request asynchronously by calling the reply callback exactly once
using cli_reply = std::function<void( CLI_MSG )>;
using cli_handler = std::function<void( const CLI_MSG &, cli_reply )>;

class CLIServer {
public:
    CLIServer( boost::asio::io_context &io_context, const std::string &path, cli_handler h );

private:
    void do_accept();
    stream_protocol::acceptor acceptor_;
    cli_handler handler;
};

class CLISession: public std::enable_shared_from_this<CLISession> {
public:
    CLISession( stream_protocol::socket sock, cli_handler h ):
        socket_( std::move( sock ) ),
        handler( std::move( h ) )
    {}

    void start();

private:
    void do_read_header();
    void do_read_body( uint32_t len );
    void do_write( std::shared_ptr<std::string> out );
    void run_cmd( const std::string &cmd );
    void reply( CLI_MSG msg );

    stream_protocol::socket socket_;
    cli_handler handler;
    std::array<uint8_t,4> header_;
    std::string body_;
};

// Blocking request/response over the control socket, used by bgpctl and tests
class CLIClientConnection {
public:
    CLIClientConnection( boost::asio::io_context &io, const std::string &path );
    CLI_MSG request( const CLI_MSG &msg );

private:
    stream_protocol::socket socket;
};

#endif
