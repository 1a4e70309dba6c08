#ifndef CONNECTION_HPP_
#define CONNECTION_HPP_

#include <array>
#include <deque>
#include <memory>
#include <vector>

#include "types.hpp"
#include "packet.hpp"

enum class CONN_DIR : uint8_t {
    INBOUND,
    OUTBOUND,
};

// One TCP connection of a session. Reads are driven by the owning bgp_fsm,
// writes are queued here and flushed in order. All members are touched on the
// session strand only.
struct bgp_connection : public std::enable_shared_from_this<bgp_connection> {
    socket_tcp sock;
    strand_t strand;
    CONN_DIR dir;
    bgp_stream stream;
    std::array<uint8_t,BGP_MAX_MSG_LEN> buffer;

    std::deque<std::shared_ptr<std::vector<uint8_t>>> tx_queue;
    bool closing { false };
    timer linger;

    bgp_connection( socket_tcp s, strand_t st, CONN_DIR d ):
        sock( std::move( s ) ),
        strand( std::move( st ) ),
        dir( d ),
        linger( sock.get_executor() )
    {}

    bool is_open() const {
        return sock.is_open() && !closing;
    }

    address_v4 local_address() const;
    address_v4 remote_address() const;

    void send( const bgp_message &msg );
    void close();

    // Lets queued messages (typically a NOTIFICATION) reach the peer before closing
    void close_after_flush();

private:
    void do_write();
    void on_send( error_code ec, std::size_t length );
};

#endif
