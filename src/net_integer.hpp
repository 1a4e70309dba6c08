#ifndef NET_INTEGER_HPP
#define NET_INTEGER_HPP

#include <cstdint>
#include <cstring>
#include <ostream>
#include <vector>

constexpr auto bswap( uint16_t val ) noexcept {
    return __builtin_bswap16( val );
}

constexpr auto bswap( uint32_t val ) noexcept {
    return __builtin_bswap32( val );
}

template<typename T>
class NetInt {
public:
    constexpr NetInt() = default;

    constexpr explicit NetInt( T v ) noexcept :
        value { bswap( v ) }
    {}

    constexpr T native() const {
        return bswap( value );
    }

    constexpr NetInt& operator=( T v ) {
        value = bswap( v );
        return *this;
    }

    friend std::ostream&
    operator<<( std::ostream& out, const NetInt& v ) {
        return out << v.native();
    }

private:
    T value;
}__attribute__((__packed__));

using BE16 = NetInt<uint16_t>;
using BE32 = NetInt<uint32_t>;

static_assert( sizeof( BE16 ) == 2, "BE16 is not 2 bytes long" );
static_assert( sizeof( BE32 ) == 4, "BE32 is not 4 bytes long" );

// Unaligned reads and appends in network byte order
inline uint16_t get_be16( const uint8_t *p ) {
    BE16 v;
    std::memcpy( &v, p, sizeof( v ) );
    return v.native();
}

inline uint32_t get_be32( const uint8_t *p ) {
    BE32 v;
    std::memcpy( &v, p, sizeof( v ) );
    return v.native();
}

inline void put_be16( std::vector<uint8_t> &out, uint16_t val ) {
    out.push_back( static_cast<uint8_t>( val >> 8 ) );
    out.push_back( static_cast<uint8_t>( val ) );
}

inline void put_be32( std::vector<uint8_t> &out, uint32_t val ) {
    out.push_back( static_cast<uint8_t>( val >> 24 ) );
    out.push_back( static_cast<uint8_t>( val >> 16 ) );
    out.push_back( static_cast<uint8_t>( val >> 8 ) );
    out.push_back( static_cast<uint8_t>( val ) );
}

#endif
