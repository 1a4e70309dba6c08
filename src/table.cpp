#include "table.hpp"
#include "log.hpp"

bgp_table_v4::bgp_table_v4( uint16_t as, address_v4 id ):
    my_as( as ),
    router_id( id )
{}

rib_changes bgp_table_v4::originate( const std::vector<prefix_v4> &prefixes ) {
    rib_changes changes;
    for( auto const &p: prefixes ) {
        bgp_route route;
        route.prefix = p.canonical();
        route.next_hop = router_id;
        route.as_path = { as_path_segment { AS_PATH_SEGMENT::AS_SEQUENCE, { my_as } } };
        route.origin = ORIGIN::IGP;
        route.peer_router_id = router_id;
        local[ route.prefix ] = route;
        logger->logInfo() << LOGS::RIB << "Originating " << route.prefix << std::endl;
        recompute( route.prefix, changes );
    }
    return changes;
}

rib_changes bgp_table_v4::peer_up( const rib_peer &peer ) {
    rib_changes changes;
    auto &p = peers[ peer.address ];
    p = peer;
    p.ibgp = ( peer.remote_as == my_as );
    adj_out[ peer.address ].clear();
    adj_in[ peer.address ];

    for( auto const &[ prefix, best ]: loc_rib ) {
        sync_out( p, prefix, best, changes );
    }
    logger->logInfo() << LOGS::RIB << "Peer " << peer.address << " up (" << ( p.ibgp ? "iBGP" : "eBGP" )
        << "), " << adj_out[ peer.address ].size() << " routes to advertise" << std::endl;
    return changes;
}

rib_changes bgp_table_v4::peer_down( const address_v4 &peer ) {
    rib_changes changes;
    if( peers.erase( peer ) == 0 ) {
        return changes;
    }
    adj_out.erase( peer );

    std::vector<prefix_v4> affected;
    if( auto it = adj_in.find( peer ); it != adj_in.end() ) {
        for( auto const &[ prefix, route ]: it->second ) {
            affected.push_back( prefix );
        }
        adj_in.erase( it );
    }
    logger->logInfo() << LOGS::RIB << "Peer " << peer << " down, withdrawing " << affected.size() << " routes" << std::endl;

    for( auto const &prefix: affected ) {
        recompute( prefix, changes );
    }
    return changes;
}

rib_changes bgp_table_v4::update( const address_v4 &peer, const std::vector<prefix_v4> &withdrawn, const std::vector<bgp_route> &routes ) {
    rib_changes changes;
    auto pit = peers.find( peer );
    if( pit == peers.end() ) {
        logger->logWarn() << LOGS::RIB << "UPDATE from " << peer << " which is not established, ignoring" << std::endl;
        return changes;
    }
    auto &in = adj_in[ peer ];
    std::set<prefix_v4,prefix_less> affected;

    for( auto const &w: withdrawn ) {
        auto prefix = w.canonical();
        if( in.erase( prefix ) > 0 ) {
            affected.insert( prefix );
        }
    }

    for( auto route: routes ) {
        route.prefix = route.prefix.canonical();
        if( as_path_contains( route.as_path, my_as ) ) {
            logger->logDebug() << LOGS::RIB << "Route " << route.prefix << " from " << peer << " contains our AS, treated as withdrawn" << std::endl;
            if( in.erase( route.prefix ) > 0 ) {
                affected.insert( route.prefix );
            }
            continue;
        }
        route.peer = peer;
        route.peer_router_id = pit->second.router_id;
        auto &slot = in[ route.prefix ];
        if( slot != route ) {
            slot = route;
            affected.insert( route.prefix );
        }
    }

    for( auto const &prefix: affected ) {
        recompute( prefix, changes );
    }
    return changes;
}

std::vector<bgp_route> bgp_table_v4::received( const std::optional<address_v4> &peer ) const {
    std::vector<bgp_route> out;
    for( auto const &[ addr, routes ]: adj_in ) {
        if( peer && *peer != addr ) {
            continue;
        }
        for( auto const &[ prefix, route ]: routes ) {
            out.push_back( route );
        }
    }
    return out;
}

std::vector<std::pair<address_v4,bgp_route>> bgp_table_v4::advertised( const std::optional<address_v4> &peer ) const {
    std::vector<std::pair<address_v4,bgp_route>> out;
    for( auto const &[ addr, routes ]: adj_out ) {
        if( peer && *peer != addr ) {
            continue;
        }
        for( auto const &[ prefix, route ]: routes ) {
            out.emplace_back( addr, route );
        }
    }
    return out;
}

std::vector<bgp_route> bgp_table_v4::best() const {
    std::vector<bgp_route> out;
    for( auto const &[ prefix, route ]: loc_rib ) {
        out.push_back( route );
    }
    return out;
}

std::optional<bgp_route> bgp_table_v4::best( const prefix_v4 &prefix ) const {
    if( auto it = loc_rib.find( prefix.canonical() ); it != loc_rib.end() ) {
        return it->second;
    }
    return std::nullopt;
}

bgp_route bgp_table_v4::effective( const bgp_route &route ) const {
    bgp_route out = route;
    // LOCAL_PREF is only meaningful inside our AS
    if( route.peer ) {
        auto it = peers.find( *route.peer );
        if( it == peers.end() || !it->second.ibgp ) {
            out.local_pref.reset();
        }
    }
    return out;
}

std::optional<bgp_route> bgp_table_v4::select( const prefix_v4 &prefix ) const {
    std::optional<bgp_route> best;
    if( auto it = local.find( prefix ); it != local.end() ) {
        best = it->second;
    }
    for( auto const &[ addr, routes ]: adj_in ) {
        auto it = routes.find( prefix );
        if( it == routes.end() ) {
            continue;
        }
        auto candidate = effective( it->second );
        if( !best || better_path( candidate, *best ) ) {
            best = std::move( candidate );
        }
    }
    return best;
}

void bgp_table_v4::recompute( const prefix_v4 &prefix, rib_changes &changes ) {
    auto best = select( prefix );
    auto it = loc_rib.find( prefix );
    if( best ) {
        if( it == loc_rib.end() || it->second != *best ) {
            logger->logDebug() << LOGS::RIB << "Best path for " << prefix << " via "
                << ( best->is_local() ? "local"s : best->peer->to_string() ) << std::endl;
        }
        loc_rib[ prefix ] = *best;
    } else if( it != loc_rib.end() ) {
        logger->logDebug() << LOGS::RIB << "No path left for " << prefix << std::endl;
        loc_rib.erase( it );
    }

    for( auto const &[ addr, peer ]: peers ) {
        sync_out( peer, prefix, best, changes );
    }
}

std::optional<bgp_route> bgp_table_v4::export_route( const bgp_route &best, const rib_peer &to ) const {
    // split horizon
    if( best.peer && *best.peer == to.address ) {
        return std::nullopt;
    }

    bool from_ibgp = false;
    if( best.peer ) {
        auto it = peers.find( *best.peer );
        from_ibgp = it != peers.end() && it->second.ibgp;
    }
    if( from_ibgp && to.ibgp ) {
        return std::nullopt;
    }

    bgp_route out = best;
    auto base_path = best.is_local() ? as_path_t {} : best.as_path;
    if( to.ibgp ) {
        out.as_path = base_path;
        out.local_pref = best.local_pref.value_or( DEFAULT_LOCAL_PREF );
        if( best.is_local() ) {
            out.next_hop = to.local_address;
        }
    } else {
        out.as_path = as_path_prepend( base_path, my_as );
        out.next_hop = to.local_address;
        out.local_pref.reset();
        out.med.reset();
    }
    return out;
}

void bgp_table_v4::sync_out( const rib_peer &to, const prefix_v4 &prefix, const std::optional<bgp_route> &best, rib_changes &changes ) {
    auto &out = adj_out[ to.address ];
    auto it = out.find( prefix );

    std::optional<bgp_route> exported;
    if( best ) {
        exported = export_route( *best, to );
    }

    if( exported ) {
        bool unchanged = it != out.end() && it->second.same_attributes( *exported );
        out[ prefix ] = *exported;
        // a new provenance with the same attributes needs no UPDATE
        if( !unchanged ) {
            changes[ to.address ].announced.push_back( *exported );
        }
    } else if( it != out.end() ) {
        out.erase( it );
        changes[ to.address ].withdrawn.push_back( prefix );
    }
}
