#include "types.hpp"
#include "cli.hpp"
#include "log.hpp"
#include "net_integer.hpp"

std::string frame_cli_msg( const CLI_MSG &msg ) {
    auto body = serialize( msg );
    std::vector<uint8_t> len;
    put_be32( len, static_cast<uint32_t>( body.size() ) );
    return std::string( len.begin(), len.end() ) + body;
}

CLIServer::CLIServer( boost::asio::io_context &io_context, const std::string &path, cli_handler h ):
    acceptor_( io_context, stream_protocol::endpoint( path ) ),
    handler( std::move( h ) )
{
    do_accept();
}

void CLIServer::do_accept() {
    acceptor_.async_accept(
        [ this ]( boost::system::error_code ec, stream_protocol::socket socket ) {
            if( ec ) {
                if( ec == boost::asio::error::operation_aborted ) {
                    return;
                }
                logger->logError() << LOGS::CLI << "Error on accepting control connection: " << ec.message() << std::endl;
            } else {
                logger->logDebug() << LOGS::CLI << "CLI new connection" << std::endl;
                std::make_shared<CLISession>( std::move( socket ), handler )->start();
            }
            do_accept();
    });
}

void CLISession::start() {
    do_read_header();
}

void CLISession::do_read_header() {
    auto self( shared_from_this() );
    boost::asio::async_read(
        socket_,
        boost::asio::buffer( header_ ),
        [ this, self ]( const boost::system::error_code &ec, std::size_t ) {
            if( ec ) {
                if( ec != boost::asio::error::eof ) {
                    logger->logDebug() << LOGS::CLI << "Control connection closed: " << ec.message() << std::endl;
                }
                return;
            }
            auto len = get_be32( header_.data() );
            if( len == 0 || len > CLI_MAX_MSG_LEN ) {
                logger->logWarn() << LOGS::CLI << "Control request with bad length " << len << ", closing" << std::endl;
                CLI_MSG out_msg {};
                out_msg.type = CLI_CMD_TYPE::RESPONSE;
                out_msg.error = "Bad request length";
                auto out = std::make_shared<std::string>( frame_cli_msg( out_msg ) );
                boost::asio::async_write( socket_, boost::asio::buffer( *out ), [ self, out ]( boost::system::error_code, std::size_t ) {} );
                return;
            }
            do_read_body( len );
        }
    );
}

void CLISession::do_read_body( uint32_t len ) {
    auto self( shared_from_this() );
    body_.resize( len );
    boost::asio::async_read(
        socket_,
        boost::asio::buffer( body_ ),
        [ this, self ]( const boost::system::error_code &ec, std::size_t ) {
            if( ec ) {
                logger->logDebug() << LOGS::CLI << "Control connection closed: " << ec.message() << std::endl;
                return;
            }
            run_cmd( body_ );
        }
    );
}

void CLISession::do_write( std::shared_ptr<std::string> out ) {
    auto self( shared_from_this() );
    boost::asio::async_write(
        socket_,
        boost::asio::buffer( out->data(), out->size() ),
        [ this, self, out ]( boost::system::error_code ec, std::size_t ) {
            if( !ec ) {
                do_read_header();
            }
        }
    );
}

void CLISession::reply( CLI_MSG msg ) {
    msg.type = CLI_CMD_TYPE::RESPONSE;
    auto output = std::make_shared<std::string>( frame_cli_msg( msg ) );
    // replies may be produced on another strand
    boost::asio::post( socket_.get_executor(), [ self = shared_from_this(), output ]() {
        self->do_write( output );
    });
}

void CLISession::run_cmd( const std::string &cmd ) {
    CLI_MSG in_msg;
    try {
        in_msg = deserialize<CLI_MSG>( cmd );
    } catch( std::exception &e ) {
        logger->logWarn() << LOGS::CLI << "Malformed control request: " << e.what() << std::endl;
        CLI_MSG out_msg {};
        out_msg.error = "Malformed request: "s + e.what();
        reply( std::move( out_msg ) );
        return;
    }

    if( in_msg.type != CLI_CMD_TYPE::REQUEST ) {
        CLI_MSG out_msg {};
        out_msg.cmd = in_msg.cmd;
        out_msg.error = "Not a request";
        reply( std::move( out_msg ) );
        return;
    }

    handler( in_msg, [ self = shared_from_this() ]( CLI_MSG out_msg ) {
        self->reply( std::move( out_msg ) );
    });
}

CLIClientConnection::CLIClientConnection( boost::asio::io_context &io, const std::string &path ):
    socket( io )
{
    socket.connect( stream_protocol::endpoint( path ) );
}

CLI_MSG CLIClientConnection::request( const CLI_MSG &msg ) {
    auto out = frame_cli_msg( msg );
    boost::asio::write( socket, boost::asio::buffer( out ) );

    std::array<uint8_t,4> header;
    boost::asio::read( socket, boost::asio::buffer( header ) );
    auto len = get_be32( header.data() );
    if( len > CLI_MAX_MSG_LEN ) {
        throw std::runtime_error( "Response is too long: "s + std::to_string( len ) );
    }
    std::string body( len, '\0' );
    boost::asio::read( socket, boost::asio::buffer( body ) );
    return deserialize<CLI_MSG>( body );
}
