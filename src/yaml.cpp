#include <stdexcept>

#include "yaml.hpp"
#include "config.hpp"

static uint16_t as_number( const YAML::Node &node, const std::string &field ) {
    auto v = node.as<uint32_t>();
    if( v == 0 || v > 65535 ) {
        throw std::invalid_argument( field + " must be in range 1..65535, got "s + std::to_string( v ) );
    }
    return static_cast<uint16_t>( v );
}

YAML::Node YAML::convert<LOGL>::encode( const LOGL &rhs ) {
    Node node;
    switch( rhs ) {
    case LOGL::TRACE:
        node = "TRACE"; break;
    case LOGL::DEBUG:
        node = "DEBUG"; break;
    case LOGL::INFO:
        node = "INFO"; break;
    case LOGL::WARN:
        node = "WARN"; break;
    case LOGL::ERROR:
        node = "ERROR"; break;
    case LOGL::ALERT:
        node = "ALERT"; break;
    }
    return node;
}

bool YAML::convert<LOGL>::decode( const YAML::Node &node, LOGL &rhs ) {
    auto t = node.as<std::string>();
    if( t == "TRACE" ) {
        rhs = LOGL::TRACE;
    } else if( t == "DEBUG" ) {
        rhs = LOGL::DEBUG;
    } else if( t == "INFO" ) {
        rhs = LOGL::INFO;
    } else if( t == "WARN" ) {
        rhs = LOGL::WARN;
    } else if( t == "ERROR" ) {
        rhs = LOGL::ERROR;
    } else if( t == "ALERT" ) {
        rhs = LOGL::ALERT;
    } else {
        return false;
    }
    return true;
}

YAML::Node YAML::convert<bgp_neighbour_v4>::encode( const bgp_neighbour_v4 &rhs ) {
    Node node;
    node[ "address" ]   = rhs.address.to_string();
    node[ "remote_as" ] = rhs.remote_as;
    if( rhs.port != 179 ) {
        node[ "port" ] = rhs.port;
    }
    if( rhs.hold_time.has_value() ) {
        node[ "hold_time" ] = *rhs.hold_time;
    }
    if( rhs.passive ) {
        node[ "passive" ] = rhs.passive;
    }
    return node;
}

bool YAML::convert<bgp_neighbour_v4>::decode( const YAML::Node &node, bgp_neighbour_v4 &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.address     = boost::asio::ip::make_address_v4( node[ "address" ].as<std::string>() );
    rhs.remote_as   = as_number( node[ "remote_as" ], "remote_as" );
    if( node[ "port" ].IsDefined() ) {
        rhs.port = node[ "port" ].as<uint16_t>();
    }
    if( node[ "hold_time" ].IsDefined() ) {
        rhs.hold_time = node[ "hold_time" ].as<uint16_t>();
    }
    if( node[ "passive" ].IsDefined() ) {
        rhs.passive = node[ "passive" ].as<bool>();
    }
    return true;
}

YAML::Node YAML::convert<global_conf>::encode( const global_conf &rhs ) {
    Node node;
    node[ "my_as" ]                 = rhs.my_as;
    node[ "bgp_router_id" ]         = rhs.bgp_router_id.to_string();
    node[ "control_socket" ]        = rhs.control_socket;
    node[ "listen_address" ]        = rhs.listen_address.to_string();
    node[ "listen_on_port" ]        = rhs.listen_on_port;
    node[ "hold_time" ]             = rhs.hold_time;
    node[ "connect_retry_time" ]    = rhs.connect_retry_time;
    node[ "connect_retry_max" ]     = rhs.connect_retry_max;
    node[ "threads" ]               = rhs.threads;
    node[ "log_level" ]             = rhs.log_level;
    std::vector<std::string> networks;
    for( auto const &n: rhs.networks ) {
        networks.push_back( n.to_string() );
    }
    node[ "networks" ]              = networks;
    node[ "neighbours" ]            = rhs.neighbours;
    return node;
}

bool YAML::convert<global_conf>::decode( const YAML::Node &node, global_conf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.my_as           = as_number( node[ "my_as" ], "my_as" );
    rhs.bgp_router_id   = boost::asio::ip::make_address_v4( node[ "bgp_router_id" ].as<std::string>() );
    rhs.control_socket  = node[ "control_socket" ].as<std::string>();
    if( node[ "listen_address" ].IsDefined() ) {
        rhs.listen_address = boost::asio::ip::make_address_v4( node[ "listen_address" ].as<std::string>() );
    }
    if( node[ "listen_on_port" ].IsDefined() ) {
        rhs.listen_on_port = node[ "listen_on_port" ].as<uint16_t>();
    }
    if( node[ "hold_time" ].IsDefined() ) {
        rhs.hold_time = node[ "hold_time" ].as<uint16_t>();
    }
    if( node[ "connect_retry_time" ].IsDefined() ) {
        rhs.connect_retry_time = node[ "connect_retry_time" ].as<uint16_t>();
    }
    if( node[ "connect_retry_max" ].IsDefined() ) {
        rhs.connect_retry_max = node[ "connect_retry_max" ].as<uint16_t>();
    }
    if( node[ "threads" ].IsDefined() ) {
        rhs.threads = node[ "threads" ].as<uint16_t>();
    }
    if( node[ "log_level" ].IsDefined() ) {
        rhs.log_level = node[ "log_level" ].as<LOGL>();
    }
    if( node[ "networks" ].IsDefined() ) {
        for( auto const &n: node[ "networks" ].as<std::vector<std::string>>() ) {
            rhs.networks.push_back( boost::asio::ip::make_network_v4( n ) );
        }
    }
    if( node[ "neighbours" ].IsDefined() ) {
        rhs.neighbours = node[ "neighbours" ].as<std::list<bgp_neighbour_v4>>();
    }
    return true;
}

global_conf load_config( const std::string &path ) {
    YAML::Node config = YAML::LoadFile( path );
    auto conf = config.as<global_conf>();
    conf.validate();
    return conf;
}
