#ifndef STRING_HELPERS_HPP_
#define STRING_HELPERS_HPP_

#include <cstdint>
#include <iosfwd>
#include <string>

enum class FSM_STATE : uint8_t;
enum class FSM_EVENT : uint8_t;
struct bgp_notification_msg;

// CLI types
struct GET_NEIGHBOURS_RESP;
struct GET_ROUTES_RESP;
struct GET_VERSION_RESP;

std::ostream& operator<<( std::ostream &stream, const FSM_STATE &state );
std::ostream& operator<<( std::ostream &stream, const FSM_EVENT &event );
std::ostream& operator<<( std::ostream &stream, const bgp_notification_msg &msg );

std::string to_string( const FSM_STATE &state );
std::string to_string( const bgp_notification_msg &msg );

// "3h12m5s" style duration used in neighbour tables
std::string format_duration( uint64_t seconds );

std::ostream& operator<<( std::ostream &stream, const GET_NEIGHBOURS_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_ROUTES_RESP &resp );
std::ostream& operator<<( std::ostream &stream, const GET_VERSION_RESP &resp );

#endif
