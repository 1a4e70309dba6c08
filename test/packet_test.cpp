#include <gtest/gtest.h>

#include "packet.hpp"

namespace {

const std::vector<uint8_t> MARKER( 16, 0xFF );

std::vector<uint8_t> open_bytes( uint8_t version = 4 ) {
    auto out = MARKER;
    out.insert( out.end(), {
        0x00, 0x1D, 0x01,       // length 29, OPEN
        version,
        0xFD, 0xE9,             // AS 65001
        0x00, 0xB4,             // hold time 180
        0x0A, 0x00, 0x00, 0x01, // 10.0.0.1
        0x00                    // no optional parameters
    });
    return out;
}

bgp_codec_error decode_error( const std::vector<uint8_t> &bytes ) {
    try {
        decode( bytes.data(), bytes.size() );
    } catch( bgp_codec_error &e ) {
        return e;
    }
    throw std::runtime_error( "message was decoded without error" );
}

bgp_update_msg sample_update() {
    bgp_update_msg update;
    update.attrs = {
        path_attr_t::make_origin( ORIGIN::IGP ),
        path_attr_t::make_as_path( { { AS_PATH_SEGMENT::AS_SEQUENCE, { 65001, 65003 } } } ),
        path_attr_t::make_next_hop( boost::asio::ip::make_address_v4( "192.0.2.1" ) ),
        path_attr_t::make_med( 50 ),
    };
    update.nlri = {
        boost::asio::ip::make_network_v4( "10.0.0.0/24" ),
        boost::asio::ip::make_network_v4( "172.16.0.0/12" ),
        boost::asio::ip::make_network_v4( "0.0.0.0/0" ),
    };
    return update;
}

std::vector<uint8_t> encode_update( const bgp_update_msg &update ) {
    return encode( update );
}

}

TEST( codec, keepalive_is_bare_header ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    ASSERT_EQ( bytes.size(), BGP_HEADER_LEN );
    EXPECT_TRUE( std::equal( MARKER.begin(), MARKER.end(), bytes.begin() ) );
    EXPECT_EQ( bytes[ 16 ], 0 );
    EXPECT_EQ( bytes[ 17 ], 19 );
    EXPECT_EQ( bytes[ 18 ], 4 );

    auto msg = decode( bytes.data(), bytes.size() );
    EXPECT_TRUE( std::holds_alternative<bgp_keepalive_msg>( msg ) );
}

TEST( codec, open_decodes_and_encodes_back ) {
    auto bytes = open_bytes();
    auto msg = decode( bytes.data(), bytes.size() );
    ASSERT_TRUE( std::holds_alternative<bgp_open_msg>( msg ) );

    auto const &open = std::get<bgp_open_msg>( msg );
    EXPECT_EQ( open.version, 4 );
    EXPECT_EQ( open.my_as, 65001 );
    EXPECT_EQ( open.hold_time, 180 );
    EXPECT_EQ( open.bgp_id, boost::asio::ip::make_address_v4( "10.0.0.1" ) );
    EXPECT_TRUE( open.params.empty() );

    EXPECT_EQ( encode( msg ), bytes );
}

TEST( codec, open_optional_parameters_are_kept ) {
    bgp_open_msg open;
    open.my_as = 65002;
    open.hold_time = 90;
    open.bgp_id = boost::asio::ip::make_address_v4( "2.2.2.2" );
    open.params.push_back( { 2, { 0x01, 0x04, 0x00, 0x01, 0x00, 0x01 } } );

    auto bytes = encode( open );
    EXPECT_EQ( bytes.size(), BGP_MIN_OPEN_LEN + 8 );

    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_open_msg>( msg );
    ASSERT_EQ( back.params.size(), 1 );
    EXPECT_EQ( back.params[ 0 ], open.params[ 0 ] );
    EXPECT_EQ( encode( msg ), bytes );
}

TEST( codec, open_with_wrong_version_is_rejected ) {
    auto err = decode_error( open_bytes( 3 ) );
    EXPECT_EQ( err.kind(), CODEC_ERROR::UNSUPPORTED_VERSION );
    EXPECT_EQ( err.code(), 2 );
    EXPECT_EQ( err.subcode(), 1 );
    EXPECT_EQ( err.data(), ( std::vector<uint8_t> { 0x00, 0x04 } ) );
}

TEST( codec, open_with_overrunning_parameters_is_rejected ) {
    auto bytes = open_bytes();
    bytes.back() = 4;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 2 );
    EXPECT_EQ( err.subcode(), 0 );
}

TEST( codec, bad_marker_is_a_sync_error ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    bytes[ 3 ] = 0x00;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 1 );
    EXPECT_EQ( err.subcode(), 1 );
}

TEST( codec, bad_header_length_is_reported_with_the_length ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    bytes[ 16 ] = 0x10;
    bytes[ 17 ] = 0x01;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.kind(), CODEC_ERROR::BAD_LENGTH );
    EXPECT_EQ( err.code(), 1 );
    EXPECT_EQ( err.subcode(), 2 );
    EXPECT_EQ( err.data(), ( std::vector<uint8_t> { 0x10, 0x01 } ) );

    bytes[ 16 ] = 0x00;
    bytes[ 17 ] = 18;
    err = decode_error( bytes );
    EXPECT_EQ( err.subcode(), 2 );
}

TEST( codec, unknown_type_is_rejected ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    bytes[ 18 ] = 5;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 1 );
    EXPECT_EQ( err.subcode(), 3 );
    EXPECT_EQ( err.data(), ( std::vector<uint8_t> { 5 } ) );
}

TEST( codec, keepalive_with_body_is_a_length_error ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    bytes.push_back( 0 );
    bytes[ 17 ] = 20;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 1 );
    EXPECT_EQ( err.subcode(), 2 );
}

TEST( codec, short_open_is_a_length_error ) {
    auto bytes = open_bytes();
    bytes.pop_back();
    bytes[ 17 ] = 28;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 1 );
    EXPECT_EQ( err.subcode(), 2 );
}

TEST( codec, notification_round_trip ) {
    bgp_notification_msg notification { BGP_ERR::UPDATE, UPDATE_ERR::MISS_WELL_KNOWN, { 3 } };
    auto bytes = encode( notification );
    EXPECT_EQ( bytes.size(), BGP_MIN_NOTIFICATION_LEN + 1 );

    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_notification_msg>( msg );
    EXPECT_EQ( back.code, 3 );
    EXPECT_EQ( back.subcode, 3 );
    EXPECT_EQ( back.data, ( std::vector<uint8_t> { 3 } ) );
    EXPECT_EQ( encode( msg ), bytes );
}

TEST( codec, update_round_trip ) {
    auto update = sample_update();
    update.withdrawn = { boost::asio::ip::make_network_v4( "192.168.1.0/24" ) };
    auto bytes = encode_update( update );

    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_update_msg>( msg );
    EXPECT_EQ( back.withdrawn, update.withdrawn );
    EXPECT_EQ( back.nlri, update.nlri );
    EXPECT_EQ( back.attrs, update.attrs );
    EXPECT_EQ( encode( msg ), bytes );

    EXPECT_EQ( back.origin(), ORIGIN::IGP );
    EXPECT_EQ( back.med(), 50u );
    EXPECT_FALSE( back.local_pref().has_value() );
    EXPECT_EQ( back.next_hop(), boost::asio::ip::make_address_v4( "192.0.2.1" ) );
    EXPECT_EQ( to_string( *back.as_path() ), "65001 65003" );
}

TEST( codec, update_routes_carry_the_attributes ) {
    auto routes = sample_update().routes();
    ASSERT_EQ( routes.size(), 3 );
    for( auto const &route: routes ) {
        EXPECT_EQ( route.next_hop, boost::asio::ip::make_address_v4( "192.0.2.1" ) );
        EXPECT_EQ( as_path_length( route.as_path ), 2 );
        EXPECT_EQ( route.med, 50u );
        EXPECT_FALSE( route.peer.has_value() );
    }
    EXPECT_EQ( routes[ 1 ].prefix, boost::asio::ip::make_network_v4( "172.16.0.0/12" ) );
}

TEST( codec, withdraw_only_update_needs_no_attributes ) {
    bgp_update_msg update;
    update.withdrawn = { boost::asio::ip::make_network_v4( "10.0.0.0/8" ) };
    auto bytes = encode( update );
    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_update_msg>( msg );
    EXPECT_EQ( back.withdrawn, update.withdrawn );
    EXPECT_TRUE( back.attrs.empty() );
    EXPECT_TRUE( back.routes().empty() );
}

TEST( codec, update_without_next_hop_is_missing_well_known ) {
    auto update = sample_update();
    update.attrs.erase( update.attrs.begin() + 2 );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 3 );
    EXPECT_EQ( err.data(), ( std::vector<uint8_t> { 3 } ) );
}

TEST( codec, update_without_origin_is_missing_well_known ) {
    auto update = sample_update();
    update.attrs.erase( update.attrs.begin() );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.subcode(), 3 );
    EXPECT_EQ( err.data(), ( std::vector<uint8_t> { 1 } ) );
}

TEST( codec, invalid_origin_value ) {
    auto update = sample_update();
    update.attrs[ 0 ].bytes[ 0 ] = 3;
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 6 );
    EXPECT_EQ( err.data(), update.attrs[ 0 ].wire() );
}

TEST( codec, zero_next_hop_is_invalid ) {
    auto update = sample_update();
    update.attrs[ 2 ] = path_attr_t::make_next_hop( address_v4 {} );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 8 );
}

TEST( codec, duplicate_attribute_is_malformed_list ) {
    auto update = sample_update();
    update.attrs.push_back( path_attr_t::make_origin( ORIGIN::EGP ) );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 1 );
}

TEST( codec, well_known_attribute_with_optional_flag ) {
    auto update = sample_update();
    update.attrs[ 0 ].flags = ATTR_FLAG::OPTIONAL | ATTR_FLAG::TRANSITIVE;
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 4 );
}

TEST( codec, next_hop_with_wrong_length ) {
    auto update = sample_update();
    update.attrs[ 2 ].bytes.push_back( 0 );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 5 );
}

TEST( codec, malformed_as_path ) {
    auto update = sample_update();
    update.attrs[ 1 ].bytes[ 0 ] = 7;
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 11 );
}

TEST( codec, nlri_prefix_longer_than_32 ) {
    auto bytes = encode( sample_update() );
    // first NLRI entry follows the attributes: 10.0.0.0/24
    auto pos = bytes.size() - ( 4 + 3 + 1 );
    ASSERT_EQ( bytes[ pos ], 24 );
    bytes[ pos ] = 33;
    auto err = decode_error( bytes );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 10 );
}

TEST( codec, unknown_optional_attribute_is_kept ) {
    auto update = sample_update();
    update.attrs.push_back( { ATTR_FLAG::OPTIONAL | ATTR_FLAG::TRANSITIVE, static_cast<PATH_ATTRIBUTE>( 99 ), { 1, 2, 3 } } );
    auto bytes = encode( update );
    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_update_msg>( msg );
    auto attr = back.find( static_cast<PATH_ATTRIBUTE>( 99 ) );
    ASSERT_NE( attr, nullptr );
    EXPECT_EQ( attr->bytes, ( std::vector<uint8_t> { 1, 2, 3 } ) );
}

TEST( codec, unknown_well_known_attribute_is_rejected ) {
    auto update = sample_update();
    update.attrs.push_back( { ATTR_FLAG::TRANSITIVE, static_cast<PATH_ATTRIBUTE>( 99 ), { 1 } } );
    auto err = decode_error( encode( update ) );
    EXPECT_EQ( err.code(), 3 );
    EXPECT_EQ( err.subcode(), 2 );
}

TEST( codec, extended_length_attribute ) {
    auto update = sample_update();
    as_path_t path;
    for( int i = 0; i < 3; i++ ) {
        as_path_segment seg { AS_PATH_SEGMENT::AS_SEQUENCE, {} };
        for( uint16_t asn = 1; asn <= 60; asn++ ) {
            seg.asns.push_back( asn );
        }
        path.push_back( seg );
    }
    update.attrs[ 1 ] = path_attr_t::make_as_path( path );
    ASSERT_GT( update.attrs[ 1 ].bytes.size(), 255 );

    auto bytes = encode( update );
    auto msg = decode( bytes.data(), bytes.size() );
    auto const &back = std::get<bgp_update_msg>( msg );
    EXPECT_TRUE( back.find( PATH_ATTRIBUTE::AS_PATH )->flags & ATTR_FLAG::EXTENDED_LENGTH );
    EXPECT_EQ( as_path_length( *back.as_path() ), 180 );
    EXPECT_EQ( encode( msg ), bytes );
}

TEST( stream, reassembles_split_messages ) {
    auto first = open_bytes();
    auto second = encode( sample_update() );
    auto third = encode( bgp_keepalive_msg {} );

    std::vector<uint8_t> wire;
    for( auto const *part: { &first, &second, &third } ) {
        wire.insert( wire.end(), part->begin(), part->end() );
    }

    bgp_stream stream;
    std::vector<bgp_message> out;
    for( auto b: wire ) {
        stream.append( &b, 1 );
        while( auto msg = stream.next() ) {
            out.push_back( *msg );
        }
    }
    ASSERT_EQ( out.size(), 3 );
    EXPECT_TRUE( std::holds_alternative<bgp_open_msg>( out[ 0 ] ) );
    EXPECT_TRUE( std::holds_alternative<bgp_update_msg>( out[ 1 ] ) );
    EXPECT_TRUE( std::holds_alternative<bgp_keepalive_msg>( out[ 2 ] ) );
    EXPECT_EQ( stream.pending(), 0 );
}

TEST( stream, reports_bad_header_before_the_body_arrives ) {
    auto bytes = encode( bgp_keepalive_msg {} );
    bytes[ 0 ] = 0;
    bgp_stream stream;
    stream.append( bytes.data(), bytes.size() );
    EXPECT_THROW( stream.next(), bgp_codec_error );
}

TEST( updates, withdrawals_come_first_and_attributes_are_grouped ) {
    bgp_route a;
    a.prefix = boost::asio::ip::make_network_v4( "10.1.0.0/16" );
    a.next_hop = boost::asio::ip::make_address_v4( "192.0.2.1" );
    a.as_path = { { AS_PATH_SEGMENT::AS_SEQUENCE, { 65001 } } };
    auto b = a;
    b.prefix = boost::asio::ip::make_network_v4( "10.2.0.0/16" );
    auto c = a;
    c.prefix = boost::asio::ip::make_network_v4( "10.3.0.0/16" );
    c.med = 10;

    auto updates = make_updates( { boost::asio::ip::make_network_v4( "10.9.0.0/16" ) }, { a, b, c } );
    ASSERT_EQ( updates.size(), 3 );
    EXPECT_EQ( updates[ 0 ].withdrawn.size(), 1 );
    EXPECT_TRUE( updates[ 0 ].nlri.empty() );
    EXPECT_EQ( updates[ 1 ].nlri.size(), 2 );
    EXPECT_FALSE( updates[ 1 ].med().has_value() );
    EXPECT_EQ( updates[ 2 ].nlri.size(), 1 );
    EXPECT_EQ( updates[ 2 ].med(), 10u );
}

TEST( updates, large_announcements_are_split ) {
    bgp_route proto;
    proto.next_hop = boost::asio::ip::make_address_v4( "192.0.2.1" );
    proto.as_path = { { AS_PATH_SEGMENT::AS_SEQUENCE, { 65001 } } };

    std::vector<bgp_route> routes;
    std::vector<prefix_v4> withdrawn;
    for( uint32_t i = 0; i < 2000; i++ ) {
        auto route = proto;
        route.prefix = prefix_v4 { address_v4 { ( 10u << 24 ) | ( i << 8 ) }, 24 };
        routes.push_back( route );
        withdrawn.push_back( prefix_v4 { address_v4 { ( 11u << 24 ) | ( i << 8 ) }, 24 } );
    }

    auto updates = make_updates( withdrawn, routes );
    ASSERT_GT( updates.size(), 2 );

    std::size_t nlri = 0;
    std::size_t wd = 0;
    bool seen_nlri = false;
    for( auto const &update: updates ) {
        auto bytes = encode( update );
        EXPECT_LE( bytes.size(), BGP_MAX_MSG_LEN );
        if( !update.nlri.empty() ) {
            seen_nlri = true;
        }
        if( seen_nlri ) {
            EXPECT_TRUE( update.withdrawn.empty() );
        }
        nlri += update.nlri.size();
        wd += update.withdrawn.size();

        auto msg = decode( bytes.data(), bytes.size() );
        EXPECT_EQ( std::get<bgp_update_msg>( msg ).nlri, update.nlri );
    }
    EXPECT_EQ( nlri, 2000 );
    EXPECT_EQ( wd, 2000 );
}
