#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "log.hpp"

struct bgp_neighbour_v4 {
    address_v4 address;
    uint16_t port { 179 };
    uint16_t remote_as { 0 };
    std::optional<uint16_t> hold_time;
    bool passive { false };
};

struct global_conf {
    std::string control_socket;
    address_v4 listen_address;
    uint16_t listen_on_port { 179 };
    uint16_t my_as { 0 };
    address_v4 bgp_router_id;
    uint16_t hold_time { 180 };
    uint16_t connect_retry_time { 5 };
    uint16_t connect_retry_max { 120 };
    uint16_t threads { 1 };
    LOGL log_level { LOGL::INFO };

    std::vector<prefix_v4> networks;
    std::list<bgp_neighbour_v4> neighbours;

    // Throws std::invalid_argument describing the first violated constraint
    void validate() const;

    uint16_t hold_time_for( const bgp_neighbour_v4 &nei ) const {
        return nei.hold_time.value_or( hold_time );
    }
};

#endif
