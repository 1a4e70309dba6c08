#ifndef PACKET_HPP_
#define PACKET_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"
#include "net_integer.hpp"
#include "route.hpp"

inline constexpr std::size_t BGP_HEADER_LEN { 19 };
inline constexpr std::size_t BGP_MAX_MSG_LEN { 4096 };
inline constexpr std::size_t BGP_MIN_OPEN_LEN { 29 };
inline constexpr std::size_t BGP_MIN_UPDATE_LEN { 23 };
inline constexpr std::size_t BGP_MIN_NOTIFICATION_LEN { 21 };
inline constexpr uint8_t BGP_VERSION { 4 };

enum class bgp_type : uint8_t {
    OPEN = 1,
    UPDATE = 2,
    NOTIFICATION = 3,
    KEEPALIVE = 4,
};

enum class PATH_ATTRIBUTE : uint8_t {
    ORIGIN = 1,
    AS_PATH = 2,
    NEXT_HOP = 3,
    MULTI_EXIT_DISC = 4,
    LOCAL_PREF = 5,
    ATOMIC_AGGREGATE = 6,
    AGGREGATOR = 7,
};

namespace ATTR_FLAG {
    inline constexpr uint8_t OPTIONAL { 0x80 };
    inline constexpr uint8_t TRANSITIVE { 0x40 };
    inline constexpr uint8_t PARTIAL { 0x20 };
    inline constexpr uint8_t EXTENDED_LENGTH { 0x10 };
}

// NOTIFICATION error codes and subcodes, RFC 4271 section 4.5
enum class BGP_ERR : uint8_t {
    HEADER = 1,
    OPEN = 2,
    UPDATE = 3,
    HOLD = 4,
    FSM = 5,
    CEASE = 6,
};

enum class HEADER_ERR : uint8_t {
    UNSPEC = 0,
    SYNC = 1,
    LENGTH = 2,
    TYPE = 3,
};

enum class OPEN_ERR : uint8_t {
    UNSPEC = 0,
    VERSION = 1,
    PEER_AS = 2,
    BGP_ID = 3,
    OPT_PARAM = 4,
    HOLD_TIME = 6,
};

enum class UPDATE_ERR : uint8_t {
    UNSPEC = 0,
    ATTR_LIST = 1,
    BAD_WELL_KNOWN = 2,
    MISS_WELL_KNOWN = 3,
    ATTR_FLAG = 4,
    ATTR_LEN = 5,
    ORIGIN = 6,
    NEXT_HOP = 8,
    OPT_ATTR = 9,
    NETFIELD = 10,
    AS_PATH = 11,
};

enum class FSM_ERR : uint8_t {
    UNSPEC = 0,
    OPEN_SENT = 1,
    OPEN_CONFIRM = 2,
    ESTABLISHED = 3,
};

enum class CEASE_ERR : uint8_t {
    UNSPEC = 0,
    MAX_PREFIX = 1,
    SHUTDOWN = 2,
    DECONF = 3,
    RESET = 4,
    REJECT = 5,
    CONFIG_CHANGE = 6,
    COLLISION = 7,
    RESOURCES = 8,
};

struct bgp_header {
    std::array<uint8_t,16> marker;
    BE16 length;
    bgp_type type;
}__attribute__((__packed__));

struct bgp_open_hdr {
    uint8_t version;
    BE16 my_as;
    BE16 hold_time;
    BE32 bgp_id;
    uint8_t opt_len;
}__attribute__((__packed__));

static_assert( sizeof( bgp_header ) == BGP_HEADER_LEN, "bgp_header is not 19 bytes long" );
static_assert( sizeof( bgp_open_hdr ) == BGP_MIN_OPEN_LEN - BGP_HEADER_LEN, "bgp_open_hdr is not 10 bytes long" );

struct bgp_open_param {
    uint8_t type;
    std::vector<uint8_t> value;

    bool operator==( const bgp_open_param &r ) const {
        return type == r.type && value == r.value;
    }
};

struct bgp_open_msg {
    uint8_t version { BGP_VERSION };
    uint16_t my_as { 0 };
    uint16_t hold_time { 0 };
    address_v4 bgp_id;
    std::vector<bgp_open_param> params;
};

struct path_attr_t {
    uint8_t flags;
    PATH_ATTRIBUTE type;
    std::vector<uint8_t> bytes;

    bool is_optional() const {
        return ( flags & ATTR_FLAG::OPTIONAL ) != 0;
    }

    bool is_transitive() const {
        return ( flags & ATTR_FLAG::TRANSITIVE ) != 0;
    }

    bool operator==( const path_attr_t &r ) const {
        return flags == r.flags && type == r.type && bytes == r.bytes;
    }

    // Full attribute as it appears on the wire, used as NOTIFICATION data
    std::vector<uint8_t> wire() const;

    uint32_t get_u32() const;

    static path_attr_t make_origin( ORIGIN origin );
    static path_attr_t make_as_path( const as_path_t &path );
    static path_attr_t make_next_hop( const address_v4 &nh );
    static path_attr_t make_med( uint32_t med );
    static path_attr_t make_local_pref( uint32_t pref );
};

struct bgp_update_msg {
    std::vector<prefix_v4> withdrawn;
    std::vector<path_attr_t> attrs;
    std::vector<prefix_v4> nlri;

    const path_attr_t* find( PATH_ATTRIBUTE type ) const;

    std::optional<ORIGIN> origin() const;
    std::optional<as_path_t> as_path() const;
    std::optional<address_v4> next_hop() const;
    std::optional<uint32_t> med() const;
    std::optional<uint32_t> local_pref() const;

    // NLRI combined with the path attributes, provenance left unset
    std::vector<bgp_route> routes() const;
};

struct bgp_notification_msg {
    uint8_t code { 0 };
    uint8_t subcode { 0 };
    std::vector<uint8_t> data;

    bgp_notification_msg() = default;

    bgp_notification_msg( uint8_t c, uint8_t s, std::vector<uint8_t> d = {} ):
        code( c ),
        subcode( s ),
        data( std::move( d ) )
    {}

    template<typename SUB>
    bgp_notification_msg( BGP_ERR c, SUB s, std::vector<uint8_t> d = {} ):
        code( static_cast<uint8_t>( c ) ),
        subcode( static_cast<uint8_t>( s ) ),
        data( std::move( d ) )
    {}
};

struct bgp_keepalive_msg {};

using bgp_message = std::variant<bgp_open_msg,bgp_update_msg,bgp_notification_msg,bgp_keepalive_msg>;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded( Ts... ) -> overloaded<Ts...>;

enum class CODEC_ERROR : uint8_t {
    MALFORMED,
    UNSUPPORTED_VERSION,
    BAD_LENGTH,
    BAD_ATTRIBUTE,
};

class bgp_codec_error : public std::runtime_error {
public:
    template<typename SUB>
    bgp_codec_error( CODEC_ERROR k, BGP_ERR c, SUB s, const std::string &what, std::vector<uint8_t> d = {} ):
        std::runtime_error( what ),
        err_kind( k ),
        err_code( static_cast<uint8_t>( c ) ),
        err_subcode( static_cast<uint8_t>( s ) ),
        err_data( std::move( d ) )
    {}

    CODEC_ERROR kind() const { return err_kind; }
    uint8_t code() const { return err_code; }
    uint8_t subcode() const { return err_subcode; }
    const std::vector<uint8_t>& data() const { return err_data; }

    bgp_notification_msg notification() const {
        return { err_code, err_subcode, err_data };
    }

private:
    CODEC_ERROR err_kind;
    uint8_t err_code;
    uint8_t err_subcode;
    std::vector<uint8_t> err_data;
};

// Length of the first complete message in the buffer, 0 if more bytes are needed.
// Throws bgp_codec_error as soon as a header with a bad marker, length or type is seen.
std::size_t bgp_frame_length( const uint8_t *data, std::size_t len );

bgp_message decode( const uint8_t *data, std::size_t len );
std::vector<uint8_t> encode( const bgp_message &msg );

// Reassembles messages out of partial TCP reads
class bgp_stream {
public:
    void append( const uint8_t *data, std::size_t len );
    std::optional<bgp_message> next();

    std::size_t pending() const {
        return buffer.size() - offset;
    }

private:
    std::vector<uint8_t> buffer;
    std::size_t offset { 0 };
};

// Packs RIB output into UPDATE messages: withdrawals first, then announced routes
// grouped by identical attributes, every message within BGP_MAX_MSG_LEN
std::vector<bgp_update_msg> make_updates( const std::vector<prefix_v4> &withdrawn, const std::vector<bgp_route> &announced );

std::vector<path_attr_t> route_attributes( const bgp_route &route );

namespace std {
    std::string to_string( PATH_ATTRIBUTE attr );
    std::string to_string( bgp_type type );
}

#endif
