#ifndef TYPES_HPP_
#define TYPES_HPP_

#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>

using io_context = boost::asio::io_context;
using acceptor = boost::asio::ip::tcp::acceptor;
using endpoint = boost::asio::ip::tcp::endpoint;
using socket_tcp = boost::asio::ip::tcp::socket;
using error_code = boost::system::error_code;
using address_v4 = boost::asio::ip::address_v4;
using prefix_v4 = boost::asio::ip::network_v4;
using timer = boost::asio::steady_timer;
using strand_t = boost::asio::strand<io_context::executor_type>;

using namespace std::string_literals;

#endif
