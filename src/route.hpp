#ifndef ROUTE_HPP_
#define ROUTE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

inline constexpr uint32_t DEFAULT_LOCAL_PREF { 100 };

enum class ORIGIN : uint8_t {
    IGP = 0,
    EGP = 1,
    INCOMPLETE = 2,
};

enum class AS_PATH_SEGMENT : uint8_t {
    AS_SET = 1,
    AS_SEQUENCE = 2,
};

struct as_path_segment {
    AS_PATH_SEGMENT type;
    std::vector<uint16_t> asns;

    bool operator==( const as_path_segment &r ) const {
        return type == r.type && asns == r.asns;
    }
    bool operator!=( const as_path_segment &r ) const {
        return !( *this == r );
    }
};

using as_path_t = std::vector<as_path_segment>;

// network_v4 has no ordering of its own
struct prefix_less {
    bool operator()( const prefix_v4 &lhs, const prefix_v4 &rhs ) const {
        if( lhs.address() != rhs.address() ) {
            return lhs.address() < rhs.address();
        }
        return lhs.prefix_length() < rhs.prefix_length();
    }
};

struct bgp_route {
    prefix_v4 prefix;
    address_v4 next_hop;
    as_path_t as_path;
    ORIGIN origin { ORIGIN::IGP };
    std::optional<uint32_t> local_pref;
    std::optional<uint32_t> med;

    // Provenance: neighbour the route was learned from, empty when locally originated
    std::optional<address_v4> peer;
    address_v4 peer_router_id;

    bool is_local() const {
        return !peer.has_value();
    }

    bool same_attributes( const bgp_route &r ) const {
        return next_hop == r.next_hop &&
            as_path == r.as_path &&
            origin == r.origin &&
            local_pref == r.local_pref &&
            med == r.med;
    }

    bool operator==( const bgp_route &r ) const {
        return prefix == r.prefix && same_attributes( r ) && peer == r.peer && peer_router_id == r.peer_router_id;
    }
    bool operator!=( const bgp_route &r ) const {
        return !( *this == r );
    }
};

// RIB output for one peer
struct rib_change {
    std::vector<prefix_v4> withdrawn;
    std::vector<bgp_route> announced;

    bool empty() const {
        return withdrawn.empty() && announced.empty();
    }
};

// AS_SET counts as a single hop
std::size_t as_path_length( const as_path_t &path );
bool as_path_contains( const as_path_t &path, uint32_t asn );
as_path_t as_path_prepend( as_path_t path, uint16_t asn );

// Strict total order used by best-path selection: true when a is preferred over b
bool better_path( const bgp_route &a, const bgp_route &b );

std::string to_string( const as_path_t &path );
std::string to_string( ORIGIN origin );

#endif
