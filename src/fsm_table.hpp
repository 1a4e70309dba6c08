#ifndef FSM_TABLE_HPP_
#define FSM_TABLE_HPP_

#include <cstdint>
#include <optional>
#include <vector>

#include "packet.hpp"

enum class FSM_STATE : uint8_t {
    IDLE,
    CONNECT,
    ACTIVE,
    OPENSENT,
    OPENCONFIRM,
    ESTABLISHED,
};

enum class FSM_EVENT : uint8_t {
    MANUAL_START,
    MANUAL_START_PASSIVE,
    AUTOMATIC_START,
    AUTOMATIC_START_PASSIVE,
    MANUAL_STOP,
    CONNECT_RETRY_TIMER_EXPIRES,
    HOLD_TIMER_EXPIRES,
    KEEPALIVE_TIMER_EXPIRES,
    TCP_CONNECTION_CONFIRMED,
    TCP_CONNECTION_FAILS,
    BGP_OPEN,
    BGP_HEADER_ERR,
    BGP_OPEN_MSG_ERR,
    NOTIF_MSG,
    KEEPALIVE_MSG,
    UPDATE_MSG,
    UPDATE_MSG_ERR,
};

inline constexpr std::size_t FSM_STATE_COUNT { 6 };
inline constexpr std::size_t FSM_EVENT_COUNT { 17 };

enum class FSM_ACTION : uint8_t {
    INITIATE_CONNECT,
    DROP_CONNECTION,
    START_CONNECT_RETRY,
    STOP_CONNECT_RETRY,
    SEND_OPEN,
    SEND_KEEPALIVE,
    SEND_NOTIFICATION,
    ARM_HOLD_LARGE,
    NEGOTIATE_TIMERS,
    RESTART_HOLD,
    RESTART_KEEPALIVE,
    PROCESS_UPDATE,
    STOP_TIMERS,
    INCREMENT_RETRY_COUNTER,
    RESET_RETRY_COUNTER,
    ROUTES_UP,
    ROUTES_DOWN,
};

struct fsm_transition {
    FSM_STATE next;
    std::vector<FSM_ACTION> actions;

    // NOTIFICATION sent by SEND_NOTIFICATION when the event itself does not carry one
    std::optional<bgp_notification_msg> notification;

    bool has( FSM_ACTION action ) const;
};

// Pure (state, event) -> (next state, actions) lookup, total over all pairs
const fsm_transition& fsm_lookup( FSM_STATE state, FSM_EVENT event );

#endif
