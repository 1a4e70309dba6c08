#include <algorithm>
#include <sstream>

#include "route.hpp"

std::size_t as_path_length( const as_path_t &path ) {
    std::size_t len = 0;
    for( auto const &seg: path ) {
        len += ( seg.type == AS_PATH_SEGMENT::AS_SET ) ? 1 : seg.asns.size();
    }
    return len;
}

bool as_path_contains( const as_path_t &path, uint32_t asn ) {
    for( auto const &seg: path ) {
        if( std::find( seg.asns.begin(), seg.asns.end(), asn ) != seg.asns.end() ) {
            return true;
        }
    }
    return false;
}

as_path_t as_path_prepend( as_path_t path, uint16_t asn ) {
    if( !path.empty() &&
        path.front().type == AS_PATH_SEGMENT::AS_SEQUENCE &&
        path.front().asns.size() < 255 )
    {
        path.front().asns.insert( path.front().asns.begin(), asn );
        return path;
    }
    path.insert( path.begin(), as_path_segment { AS_PATH_SEGMENT::AS_SEQUENCE, { asn } } );
    return path;
}

bool better_path( const bgp_route &a, const bgp_route &b ) {
    auto a_pref = a.local_pref.value_or( DEFAULT_LOCAL_PREF );
    auto b_pref = b.local_pref.value_or( DEFAULT_LOCAL_PREF );
    if( a_pref != b_pref ) {
        return a_pref > b_pref;
    }

    auto a_len = as_path_length( a.as_path );
    auto b_len = as_path_length( b.as_path );
    if( a_len != b_len ) {
        return a_len < b_len;
    }

    if( a.origin != b.origin ) {
        return a.origin < b.origin;
    }

    auto a_med = a.med.value_or( 0 );
    auto b_med = b.med.value_or( 0 );
    if( a_med != b_med ) {
        return a_med < b_med;
    }

    if( a.peer_router_id != b.peer_router_id ) {
        return a.peer_router_id.to_uint() < b.peer_router_id.to_uint();
    }

    // Candidates of one prefix have distinct provenance, so this never ties
    if( a.is_local() != b.is_local() ) {
        return a.is_local();
    }
    if( a.is_local() ) {
        return false;
    }
    return a.peer->to_uint() < b.peer->to_uint();
}

std::string to_string( const as_path_t &path ) {
    std::ostringstream ss;
    bool first = true;
    for( auto const &seg: path ) {
        if( !first ) {
            ss << " ";
        }
        first = false;
        if( seg.type == AS_PATH_SEGMENT::AS_SET ) {
            ss << "{";
        }
        for( std::size_t i = 0; i < seg.asns.size(); i++ ) {
            if( i != 0 ) {
                ss << ( seg.type == AS_PATH_SEGMENT::AS_SET ? "," : " " );
            }
            ss << seg.asns[ i ];
        }
        if( seg.type == AS_PATH_SEGMENT::AS_SET ) {
            ss << "}";
        }
    }
    return ss.str();
}

std::string to_string( ORIGIN origin ) {
    switch( origin ) {
    case ORIGIN::IGP:
        return "IGP";
    case ORIGIN::EGP:
        return "EGP";
    case ORIGIN::INCOMPLETE:
        return "INCOMPLETE";
    }
    return "ERROR";
}
