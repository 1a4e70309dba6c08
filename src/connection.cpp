#include <functional>

#include "connection.hpp"
#include "log.hpp"

static constexpr auto LINGER_TIME { std::chrono::seconds( 1 ) };

address_v4 bgp_connection::local_address() const {
    error_code ec;
    auto ep = sock.local_endpoint( ec );
    if( ec ) {
        return {};
    }
    return ep.address().to_v4();
}

address_v4 bgp_connection::remote_address() const {
    error_code ec;
    auto ep = sock.remote_endpoint( ec );
    if( ec ) {
        return {};
    }
    return ep.address().to_v4();
}

void bgp_connection::send( const bgp_message &msg ) {
    if( closing || !sock.is_open() ) {
        return;
    }
    auto pkt_buf = std::make_shared<std::vector<uint8_t>>( encode( msg ) );
    tx_queue.push_back( pkt_buf );
    if( tx_queue.size() == 1 ) {
        do_write();
    }
}

void bgp_connection::do_write() {
    boost::asio::async_write( sock, boost::asio::buffer( *tx_queue.front() ),
        boost::asio::bind_executor( strand, std::bind( &bgp_connection::on_send, shared_from_this(), std::placeholders::_1, std::placeholders::_2 ) ) );
}

void bgp_connection::on_send( error_code ec, std::size_t length ) {
    if( ec ) {
        if( ec != boost::asio::error::operation_aborted ) {
            logger->logDebug() << LOGS::PACKET << "Error on sending message: " << ec.message() << std::endl;
        }
        tx_queue.clear();
        close();
        return;
    }
    logger->logTrace() << LOGS::PACKET << "Successfully sent a message with size: " << length << std::endl;
    tx_queue.pop_front();
    if( !tx_queue.empty() ) {
        do_write();
    } else if( closing ) {
        close();
    }
}

void bgp_connection::close() {
    closing = true;
    linger.cancel();
    if( !sock.is_open() ) {
        return;
    }
    error_code ec;
    sock.shutdown( socket_tcp::shutdown_both, ec );
    sock.close( ec );
    if( ec ) {
        logger->logDebug() << LOGS::PACKET << "Error on closing socket: " << ec.message() << std::endl;
    }
}

void bgp_connection::close_after_flush() {
    if( tx_queue.empty() ) {
        close();
        return;
    }
    closing = true;
    linger.expires_after( LINGER_TIME );
    linger.async_wait( boost::asio::bind_executor( strand, [ self = shared_from_this() ]( error_code ec ) {
        if( !ec ) {
            self->close();
        }
    }));
}
