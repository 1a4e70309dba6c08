#ifndef TABLE_HPP_
#define TABLE_HPP_

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "types.hpp"
#include "route.hpp"

// Established session as seen by the RIB
struct rib_peer {
    address_v4 address;
    address_v4 router_id;
    // our end of the session, used as NEXT_HOP towards this peer
    address_v4 local_address;
    uint16_t remote_as;
    bool ibgp;
};

// Per target peer output of one RIB operation
using rib_changes = std::map<address_v4,rib_change>;

// Adj-RIB-In per peer, local originations, Loc-RIB and Adj-RIB-Out per peer.
// Not thread safe: the owner serializes every call.
class bgp_table_v4 {
public:
    bgp_table_v4( uint16_t my_as, address_v4 router_id );

    rib_changes originate( const std::vector<prefix_v4> &prefixes );
    rib_changes peer_up( const rib_peer &peer );
    rib_changes peer_down( const address_v4 &peer );
    rib_changes update( const address_v4 &peer, const std::vector<prefix_v4> &withdrawn, const std::vector<bgp_route> &routes );

    // Adj-RIB-In, locally originated routes are not listed
    std::vector<bgp_route> received( const std::optional<address_v4> &peer = std::nullopt ) const;
    // Adj-RIB-Out as (target peer, exported route)
    std::vector<std::pair<address_v4,bgp_route>> advertised( const std::optional<address_v4> &peer = std::nullopt ) const;
    // Loc-RIB
    std::vector<bgp_route> best() const;
    std::optional<bgp_route> best( const prefix_v4 &prefix ) const;

    bool is_up( const address_v4 &peer ) const {
        return peers.find( peer ) != peers.end();
    }

private:
    using route_map = std::map<prefix_v4,bgp_route,prefix_less>;

    uint16_t my_as;
    address_v4 router_id;

    std::map<address_v4,rib_peer> peers;
    std::map<address_v4,route_map> adj_in;
    route_map local;
    route_map loc_rib;
    std::map<address_v4,route_map> adj_out;

    void recompute( const prefix_v4 &prefix, rib_changes &changes );
    // Adj-RIB-In entry as used for selection
    bgp_route effective( const bgp_route &route ) const;
    std::optional<bgp_route> select( const prefix_v4 &prefix ) const;
    std::optional<bgp_route> export_route( const bgp_route &best, const rib_peer &to ) const;
    void sync_out( const rib_peer &to, const prefix_v4 &prefix, const std::optional<bgp_route> &best, rib_changes &changes );
};

#endif
