#include <algorithm>
#include <cstring>

#include "packet.hpp"

namespace {

const std::array<uint8_t,16> BGP_MARKER {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF
};

std::vector<uint8_t> be16_data( uint16_t v ) {
    std::vector<uint8_t> out;
    put_be16( out, v );
    return out;
}

std::size_t prefix_wire_len( const prefix_v4 &p ) {
    return 1 + ( p.prefix_length() + 7 ) / 8;
}

void put_prefix( std::vector<uint8_t> &out, const prefix_v4 &p ) {
    out.push_back( static_cast<uint8_t>( p.prefix_length() ) );
    auto bytes = p.address().to_bytes();
    auto n = ( p.prefix_length() + 7 ) / 8;
    out.insert( out.end(), bytes.begin(), bytes.begin() + n );
}

// Parses a withdrawn routes or NLRI field of exactly len bytes
std::vector<prefix_v4> parse_prefixes( const uint8_t *data, std::size_t len, bool nlri ) {
    std::vector<prefix_v4> out;
    std::size_t offset = 0;
    while( offset < len ) {
        uint8_t plen = data[ offset ];
        if( plen > 32 ) {
            if( nlri ) {
                throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::NETFIELD, "Invalid NLRI prefix length "s + std::to_string( plen ) };
            }
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Invalid withdrawn prefix length "s + std::to_string( plen ) };
        }
        std::size_t bytes = ( plen + 7 ) / 8;
        if( offset + 1 + bytes > len ) {
            if( nlri ) {
                throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::NETFIELD, "Truncated NLRI prefix" };
            }
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Truncated withdrawn prefix" };
        }
        address_v4::bytes_type addr { 0, 0, 0, 0 };
        std::memcpy( addr.data(), data + offset + 1, bytes );
        out.emplace_back( address_v4 { addr }, plen );
        offset += 1 + bytes;
    }
    return out;
}

void check_attr_flags( const path_attr_t &attr, bool optional, bool transitive ) {
    if( attr.is_optional() != optional || attr.is_transitive() != transitive ) {
        throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_FLAG,
            "Bad flags for attribute "s + std::to_string( attr.type ), attr.wire() };
    }
}

void check_attr_len( const path_attr_t &attr, std::size_t len ) {
    if( attr.bytes.size() != len ) {
        throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LEN,
            "Bad length for attribute "s + std::to_string( attr.type ), attr.wire() };
    }
}

as_path_t parse_as_path( const std::vector<uint8_t> &bytes ) {
    as_path_t path;
    std::size_t offset = 0;
    while( offset < bytes.size() ) {
        if( offset + 2 > bytes.size() ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::AS_PATH, "Truncated AS_PATH segment header" };
        }
        auto type = bytes[ offset ];
        auto count = bytes[ offset + 1 ];
        if( type != static_cast<uint8_t>( AS_PATH_SEGMENT::AS_SET ) && type != static_cast<uint8_t>( AS_PATH_SEGMENT::AS_SEQUENCE ) ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::AS_PATH, "Unknown AS_PATH segment type "s + std::to_string( type ) };
        }
        if( count == 0 || offset + 2 + count * 2 > bytes.size() ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::AS_PATH, "Bad AS_PATH segment length" };
        }
        as_path_segment seg { static_cast<AS_PATH_SEGMENT>( type ), {} };
        for( int i = 0; i < count; i++ ) {
            seg.asns.push_back( get_be16( bytes.data() + offset + 2 + i * 2 ) );
        }
        path.push_back( std::move( seg ) );
        offset += 2 + count * 2;
    }
    return path;
}

void validate_attr( const path_attr_t &attr ) {
    switch( attr.type ) {
    case PATH_ATTRIBUTE::ORIGIN:
        check_attr_flags( attr, false, true );
        check_attr_len( attr, 1 );
        if( attr.bytes[ 0 ] > static_cast<uint8_t>( ORIGIN::INCOMPLETE ) ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::ORIGIN,
                "Invalid ORIGIN value "s + std::to_string( attr.bytes[ 0 ] ), attr.wire() };
        }
        break;
    case PATH_ATTRIBUTE::AS_PATH:
        check_attr_flags( attr, false, true );
        parse_as_path( attr.bytes );
        break;
    case PATH_ATTRIBUTE::NEXT_HOP: {
        check_attr_flags( attr, false, true );
        check_attr_len( attr, 4 );
        address_v4 nh { attr.get_u32() };
        if( nh.is_unspecified() || nh.is_multicast() || nh == address_v4::broadcast() ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::NEXT_HOP,
                "Invalid NEXT_HOP "s + nh.to_string(), attr.wire() };
        }
        break;
    }
    case PATH_ATTRIBUTE::MULTI_EXIT_DISC:
        check_attr_flags( attr, true, false );
        check_attr_len( attr, 4 );
        break;
    case PATH_ATTRIBUTE::LOCAL_PREF:
        check_attr_flags( attr, false, true );
        check_attr_len( attr, 4 );
        break;
    case PATH_ATTRIBUTE::ATOMIC_AGGREGATE:
        check_attr_flags( attr, false, true );
        check_attr_len( attr, 0 );
        break;
    case PATH_ATTRIBUTE::AGGREGATOR:
        check_attr_flags( attr, true, true );
        check_attr_len( attr, 6 );
        break;
    default:
        if( !attr.is_optional() ) {
            throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::BAD_WELL_KNOWN,
                "Unrecognized well-known attribute "s + std::to_string( attr.type ), attr.wire() };
        }
        break;
    }
}

std::vector<path_attr_t> parse_attributes( const uint8_t *data, std::size_t len ) {
    std::vector<path_attr_t> attrs;
    std::size_t offset = 0;
    while( offset < len ) {
        if( offset + 3 > len ) {
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Truncated attribute header" };
        }
        auto flags = data[ offset ];
        auto type = static_cast<PATH_ATTRIBUTE>( data[ offset + 1 ] );
        std::size_t attr_len;
        std::size_t hdr_len;
        if( flags & ATTR_FLAG::EXTENDED_LENGTH ) {
            if( offset + 4 > len ) {
                throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Truncated attribute header" };
            }
            attr_len = get_be16( data + offset + 2 );
            hdr_len = 4;
        } else {
            attr_len = data[ offset + 2 ];
            hdr_len = 3;
        }
        if( offset + hdr_len + attr_len > len ) {
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST,
                "Attribute "s + std::to_string( type ) + " overruns the attribute list" };
        }
        auto dup = std::find_if( attrs.begin(), attrs.end(), [ type ]( auto const &a ) { return a.type == type; } );
        if( dup != attrs.end() ) {
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST,
                "Duplicate attribute "s + std::to_string( type ) };
        }
        auto body = data + offset + hdr_len;
        path_attr_t attr { flags, type, std::vector<uint8_t>( body, body + attr_len ) };
        validate_attr( attr );
        attrs.push_back( std::move( attr ) );
        offset += hdr_len + attr_len;
    }
    return attrs;
}

bgp_open_msg decode_open( const uint8_t *body, std::size_t len ) {
    bgp_open_hdr hdr;
    std::memcpy( &hdr, body, sizeof( hdr ) );
    if( hdr.version != BGP_VERSION ) {
        throw bgp_codec_error { CODEC_ERROR::UNSUPPORTED_VERSION, BGP_ERR::OPEN, OPEN_ERR::VERSION,
            "Unsupported BGP version "s + std::to_string( hdr.version ), be16_data( BGP_VERSION ) };
    }
    if( sizeof( hdr ) + hdr.opt_len != len ) {
        throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::OPEN, OPEN_ERR::UNSPEC, "OPEN optional parameters length mismatch" };
    }

    bgp_open_msg open;
    open.version = hdr.version;
    open.my_as = hdr.my_as.native();
    open.hold_time = hdr.hold_time.native();
    open.bgp_id = address_v4 { hdr.bgp_id.native() };

    auto params = body + sizeof( hdr );
    std::size_t offset = 0;
    while( offset < hdr.opt_len ) {
        if( offset + 2 > hdr.opt_len ) {
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::OPEN, OPEN_ERR::UNSPEC, "Truncated OPEN optional parameter" };
        }
        auto type = params[ offset ];
        std::size_t plen = params[ offset + 1 ];
        if( offset + 2 + plen > hdr.opt_len ) {
            throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::OPEN, OPEN_ERR::UNSPEC, "OPEN optional parameter overruns the message" };
        }
        open.params.push_back( { type, std::vector<uint8_t>( params + offset + 2, params + offset + 2 + plen ) } );
        offset += 2 + plen;
    }
    return open;
}

bgp_update_msg decode_update( const uint8_t *body, std::size_t len ) {
    bgp_update_msg update;

    std::size_t withdrawn_len = get_be16( body );
    if( 2 + withdrawn_len + 2 > len ) {
        throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Withdrawn routes length overruns the message" };
    }
    update.withdrawn = parse_prefixes( body + 2, withdrawn_len, false );

    auto offset = 2 + withdrawn_len;
    std::size_t attrs_len = get_be16( body + offset );
    offset += 2;
    if( offset + attrs_len > len ) {
        throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::UPDATE, UPDATE_ERR::ATTR_LIST, "Path attributes length overruns the message" };
    }
    update.attrs = parse_attributes( body + offset, attrs_len );
    offset += attrs_len;

    update.nlri = parse_prefixes( body + offset, len - offset, true );

    if( !update.nlri.empty() ) {
        for( auto type: { PATH_ATTRIBUTE::ORIGIN, PATH_ATTRIBUTE::AS_PATH, PATH_ATTRIBUTE::NEXT_HOP } ) {
            if( update.find( type ) == nullptr ) {
                throw bgp_codec_error { CODEC_ERROR::BAD_ATTRIBUTE, BGP_ERR::UPDATE, UPDATE_ERR::MISS_WELL_KNOWN,
                    "Missing well-known attribute "s + std::to_string( type ), { static_cast<uint8_t>( type ) } };
            }
        }
    }
    return update;
}

void encode_header( std::vector<uint8_t> &out, bgp_type type ) {
    out.insert( out.end(), BGP_MARKER.begin(), BGP_MARKER.end() );
    put_be16( out, 0 );
    out.push_back( static_cast<uint8_t>( type ) );
}

void encode_attr( std::vector<uint8_t> &out, const path_attr_t &attr ) {
    auto flags = attr.flags;
    if( attr.bytes.size() > 255 ) {
        flags |= ATTR_FLAG::EXTENDED_LENGTH;
    }
    out.push_back( flags );
    out.push_back( static_cast<uint8_t>( attr.type ) );
    if( flags & ATTR_FLAG::EXTENDED_LENGTH ) {
        put_be16( out, static_cast<uint16_t>( attr.bytes.size() ) );
    } else {
        out.push_back( static_cast<uint8_t>( attr.bytes.size() ) );
    }
    out.insert( out.end(), attr.bytes.begin(), attr.bytes.end() );
}

std::size_t attr_wire_len( const path_attr_t &attr ) {
    bool ext = ( attr.flags & ATTR_FLAG::EXTENDED_LENGTH ) || attr.bytes.size() > 255;
    return ( ext ? 4 : 3 ) + attr.bytes.size();
}

}

std::vector<uint8_t> path_attr_t::wire() const {
    std::vector<uint8_t> out;
    encode_attr( out, *this );
    return out;
}

uint32_t path_attr_t::get_u32() const {
    if( bytes.size() < 4 ) {
        return 0;
    }
    return get_be32( bytes.data() );
}

path_attr_t path_attr_t::make_origin( ORIGIN origin ) {
    return { ATTR_FLAG::TRANSITIVE, PATH_ATTRIBUTE::ORIGIN, { static_cast<uint8_t>( origin ) } };
}

path_attr_t path_attr_t::make_as_path( const as_path_t &path ) {
    path_attr_t attr { ATTR_FLAG::TRANSITIVE, PATH_ATTRIBUTE::AS_PATH, {} };
    for( auto const &seg: path ) {
        attr.bytes.push_back( static_cast<uint8_t>( seg.type ) );
        attr.bytes.push_back( static_cast<uint8_t>( seg.asns.size() ) );
        for( auto const &asn: seg.asns ) {
            put_be16( attr.bytes, asn );
        }
    }
    return attr;
}

path_attr_t path_attr_t::make_next_hop( const address_v4 &nh ) {
    path_attr_t attr { ATTR_FLAG::TRANSITIVE, PATH_ATTRIBUTE::NEXT_HOP, {} };
    put_be32( attr.bytes, nh.to_uint() );
    return attr;
}

path_attr_t path_attr_t::make_med( uint32_t med ) {
    path_attr_t attr { ATTR_FLAG::OPTIONAL, PATH_ATTRIBUTE::MULTI_EXIT_DISC, {} };
    put_be32( attr.bytes, med );
    return attr;
}

path_attr_t path_attr_t::make_local_pref( uint32_t pref ) {
    path_attr_t attr { ATTR_FLAG::TRANSITIVE, PATH_ATTRIBUTE::LOCAL_PREF, {} };
    put_be32( attr.bytes, pref );
    return attr;
}

const path_attr_t* bgp_update_msg::find( PATH_ATTRIBUTE type ) const {
    for( auto const &attr: attrs ) {
        if( attr.type == type ) {
            return &attr;
        }
    }
    return nullptr;
}

std::optional<ORIGIN> bgp_update_msg::origin() const {
    if( auto attr = find( PATH_ATTRIBUTE::ORIGIN ); attr != nullptr && !attr->bytes.empty() ) {
        return static_cast<ORIGIN>( attr->bytes[ 0 ] );
    }
    return std::nullopt;
}

std::optional<as_path_t> bgp_update_msg::as_path() const {
    if( auto attr = find( PATH_ATTRIBUTE::AS_PATH ); attr != nullptr ) {
        return parse_as_path( attr->bytes );
    }
    return std::nullopt;
}

std::optional<address_v4> bgp_update_msg::next_hop() const {
    if( auto attr = find( PATH_ATTRIBUTE::NEXT_HOP ); attr != nullptr ) {
        return address_v4 { attr->get_u32() };
    }
    return std::nullopt;
}

std::optional<uint32_t> bgp_update_msg::med() const {
    if( auto attr = find( PATH_ATTRIBUTE::MULTI_EXIT_DISC ); attr != nullptr ) {
        return attr->get_u32();
    }
    return std::nullopt;
}

std::optional<uint32_t> bgp_update_msg::local_pref() const {
    if( auto attr = find( PATH_ATTRIBUTE::LOCAL_PREF ); attr != nullptr ) {
        return attr->get_u32();
    }
    return std::nullopt;
}

std::vector<bgp_route> bgp_update_msg::routes() const {
    std::vector<bgp_route> out;
    if( nlri.empty() ) {
        return out;
    }
    bgp_route proto;
    proto.next_hop = next_hop().value_or( address_v4 {} );
    proto.as_path = as_path().value_or( as_path_t {} );
    proto.origin = origin().value_or( ORIGIN::INCOMPLETE );
    proto.local_pref = local_pref();
    proto.med = med();
    for( auto const &prefix: nlri ) {
        auto route = proto;
        route.prefix = prefix.canonical();
        out.push_back( std::move( route ) );
    }
    return out;
}

std::size_t bgp_frame_length( const uint8_t *data, std::size_t len ) {
    if( len < BGP_HEADER_LEN ) {
        return 0;
    }
    bgp_header hdr;
    std::memcpy( &hdr, data, sizeof( hdr ) );
    if( hdr.marker != BGP_MARKER ) {
        throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::HEADER, HEADER_ERR::SYNC, "Connection not synchronized" };
    }
    auto msg_len = hdr.length.native();
    if( msg_len < BGP_HEADER_LEN || msg_len > BGP_MAX_MSG_LEN ) {
        throw bgp_codec_error { CODEC_ERROR::BAD_LENGTH, BGP_ERR::HEADER, HEADER_ERR::LENGTH,
            "Bad message length "s + std::to_string( msg_len ), be16_data( msg_len ) };
    }
    auto type = static_cast<uint8_t>( hdr.type );
    if( type < static_cast<uint8_t>( bgp_type::OPEN ) || type > static_cast<uint8_t>( bgp_type::KEEPALIVE ) ) {
        throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::HEADER, HEADER_ERR::TYPE,
            "Bad message type "s + std::to_string( type ), { type } };
    }
    if( len < msg_len ) {
        return 0;
    }
    return msg_len;
}

bgp_message decode( const uint8_t *data, std::size_t len ) {
    auto msg_len = bgp_frame_length( data, len );
    if( msg_len == 0 ) {
        throw bgp_codec_error { CODEC_ERROR::BAD_LENGTH, BGP_ERR::HEADER, HEADER_ERR::LENGTH, "Truncated message" };
    }
    bgp_header hdr;
    std::memcpy( &hdr, data, sizeof( hdr ) );
    auto body = data + BGP_HEADER_LEN;
    auto body_len = msg_len - BGP_HEADER_LEN;

    auto bad_length = [ & ]( const std::string &what ) {
        return bgp_codec_error { CODEC_ERROR::BAD_LENGTH, BGP_ERR::HEADER, HEADER_ERR::LENGTH, what, be16_data( msg_len ) };
    };

    switch( hdr.type ) {
    case bgp_type::OPEN:
        if( msg_len < BGP_MIN_OPEN_LEN ) {
            throw bad_length( "OPEN message is too short" );
        }
        return decode_open( body, body_len );
    case bgp_type::UPDATE:
        if( msg_len < BGP_MIN_UPDATE_LEN ) {
            throw bad_length( "UPDATE message is too short" );
        }
        return decode_update( body, body_len );
    case bgp_type::NOTIFICATION:
        if( msg_len < BGP_MIN_NOTIFICATION_LEN ) {
            throw bad_length( "NOTIFICATION message is too short" );
        }
        return bgp_notification_msg { body[ 0 ], body[ 1 ], std::vector<uint8_t>( body + 2, body + body_len ) };
    case bgp_type::KEEPALIVE:
        if( msg_len != BGP_HEADER_LEN ) {
            throw bad_length( "KEEPALIVE message carries a body" );
        }
        return bgp_keepalive_msg {};
    }
    throw bgp_codec_error { CODEC_ERROR::MALFORMED, BGP_ERR::HEADER, HEADER_ERR::TYPE, "Bad message type" };
}

std::vector<uint8_t> encode( const bgp_message &msg ) {
    std::vector<uint8_t> out;
    out.reserve( BGP_HEADER_LEN );

    std::visit( overloaded {
        [ &out ]( const bgp_open_msg &open ) {
            encode_header( out, bgp_type::OPEN );
            out.push_back( open.version );
            put_be16( out, open.my_as );
            put_be16( out, open.hold_time );
            put_be32( out, open.bgp_id.to_uint() );
            std::vector<uint8_t> params;
            for( auto const &param: open.params ) {
                params.push_back( param.type );
                params.push_back( static_cast<uint8_t>( param.value.size() ) );
                params.insert( params.end(), param.value.begin(), param.value.end() );
            }
            out.push_back( static_cast<uint8_t>( params.size() ) );
            out.insert( out.end(), params.begin(), params.end() );
        },
        [ &out ]( const bgp_update_msg &update ) {
            encode_header( out, bgp_type::UPDATE );
            std::vector<uint8_t> field;
            for( auto const &p: update.withdrawn ) {
                put_prefix( field, p );
            }
            put_be16( out, static_cast<uint16_t>( field.size() ) );
            out.insert( out.end(), field.begin(), field.end() );

            field.clear();
            for( auto const &attr: update.attrs ) {
                encode_attr( field, attr );
            }
            put_be16( out, static_cast<uint16_t>( field.size() ) );
            out.insert( out.end(), field.begin(), field.end() );

            for( auto const &p: update.nlri ) {
                put_prefix( out, p );
            }
        },
        [ &out ]( const bgp_notification_msg &notification ) {
            encode_header( out, bgp_type::NOTIFICATION );
            out.push_back( notification.code );
            out.push_back( notification.subcode );
            out.insert( out.end(), notification.data.begin(), notification.data.end() );
        },
        [ &out ]( const bgp_keepalive_msg & ) {
            encode_header( out, bgp_type::KEEPALIVE );
        }
    }, msg );

    auto len = static_cast<uint16_t>( out.size() );
    out[ 16 ] = static_cast<uint8_t>( len >> 8 );
    out[ 17 ] = static_cast<uint8_t>( len );
    return out;
}

void bgp_stream::append( const uint8_t *data, std::size_t len ) {
    if( offset > 0 && offset == buffer.size() ) {
        buffer.clear();
        offset = 0;
    } else if( offset > BGP_MAX_MSG_LEN ) {
        buffer.erase( buffer.begin(), buffer.begin() + offset );
        offset = 0;
    }
    buffer.insert( buffer.end(), data, data + len );
}

std::optional<bgp_message> bgp_stream::next() {
    auto msg_len = bgp_frame_length( buffer.data() + offset, pending() );
    if( msg_len == 0 ) {
        return std::nullopt;
    }
    auto start = buffer.data() + offset;
    offset += msg_len;
    return decode( start, msg_len );
}

std::vector<path_attr_t> route_attributes( const bgp_route &route ) {
    std::vector<path_attr_t> attrs;
    attrs.push_back( path_attr_t::make_origin( route.origin ) );
    attrs.push_back( path_attr_t::make_as_path( route.as_path ) );
    attrs.push_back( path_attr_t::make_next_hop( route.next_hop ) );
    if( route.med ) {
        attrs.push_back( path_attr_t::make_med( *route.med ) );
    }
    if( route.local_pref ) {
        attrs.push_back( path_attr_t::make_local_pref( *route.local_pref ) );
    }
    return attrs;
}

std::vector<bgp_update_msg> make_updates( const std::vector<prefix_v4> &withdrawn, const std::vector<bgp_route> &announced ) {
    std::vector<bgp_update_msg> out;

    // header, withdrawn length and attributes length fields
    const std::size_t base_len = BGP_HEADER_LEN + 2 + 2;

    if( !withdrawn.empty() ) {
        bgp_update_msg msg;
        std::size_t len = base_len;
        for( auto const &p: withdrawn ) {
            if( len + prefix_wire_len( p ) > BGP_MAX_MSG_LEN ) {
                out.push_back( std::move( msg ) );
                msg = {};
                len = base_len;
            }
            msg.withdrawn.push_back( p );
            len += prefix_wire_len( p );
        }
        out.push_back( std::move( msg ) );
    }

    std::vector<std::pair<const bgp_route*,std::vector<prefix_v4>>> groups;
    for( auto const &route: announced ) {
        auto it = std::find_if( groups.begin(), groups.end(), [ &route ]( auto const &g ) {
            return g.first->same_attributes( route );
        });
        if( it == groups.end() ) {
            groups.push_back( { &route, { route.prefix } } );
        } else {
            it->second.push_back( route.prefix );
        }
    }

    for( auto const &[ proto, prefixes ]: groups ) {
        bgp_update_msg msg;
        msg.attrs = route_attributes( *proto );
        std::size_t attrs_len = base_len;
        for( auto const &attr: msg.attrs ) {
            attrs_len += attr_wire_len( attr );
        }
        std::size_t len = attrs_len;
        for( auto const &p: prefixes ) {
            if( len + prefix_wire_len( p ) > BGP_MAX_MSG_LEN ) {
                out.push_back( msg );
                msg.nlri.clear();
                len = attrs_len;
            }
            msg.nlri.push_back( p );
            len += prefix_wire_len( p );
        }
        out.push_back( std::move( msg ) );
    }
    return out;
}

namespace std {
    std::string to_string( PATH_ATTRIBUTE attr ) {
        switch( attr ) {
        case PATH_ATTRIBUTE::ORIGIN: return "ORIGIN";
        case PATH_ATTRIBUTE::AS_PATH: return "AS_PATH";
        case PATH_ATTRIBUTE::NEXT_HOP: return "NEXT_HOP";
        case PATH_ATTRIBUTE::MULTI_EXIT_DISC: return "MULTI_EXIT_DISC";
        case PATH_ATTRIBUTE::LOCAL_PREF: return "LOCAL_PREF";
        case PATH_ATTRIBUTE::ATOMIC_AGGREGATE: return "ATOMIC_AGGREGATE";
        case PATH_ATTRIBUTE::AGGREGATOR: return "AGGREGATOR";
        }
        return "UNKNOWN("s + std::to_string( static_cast<int>( attr ) ) + ")";
    }

    std::string to_string( bgp_type type ) {
        switch( type ) {
        case bgp_type::OPEN: return "OPEN";
        case bgp_type::UPDATE: return "UPDATE";
        case bgp_type::NOTIFICATION: return "NOTIFICATION";
        case bgp_type::KEEPALIVE: return "KEEPALIVE";
        }
        return "UNKNOWN("s + std::to_string( static_cast<int>( type ) ) + ")";
    }
}
