#include <algorithm>
#include <array>

#include "fsm_table.hpp"

namespace {

using A = FSM_ACTION;
using row_t = std::array<fsm_transition,FSM_EVENT_COUNT>;
using table_t = std::array<row_t,FSM_STATE_COUNT>;

const bgp_notification_msg HOLD_EXPIRED { BGP_ERR::HOLD, 0 };
const bgp_notification_msg ADMIN_SHUTDOWN { BGP_ERR::CEASE, CEASE_ERR::SHUTDOWN };

fsm_transition& at( table_t &t, FSM_STATE s, FSM_EVENT e ) {
    return t[ static_cast<std::size_t>( s ) ][ static_cast<std::size_t>( e ) ];
}

void fill_row( table_t &t, FSM_STATE s, const fsm_transition &def ) {
    for( auto &tr: t[ static_cast<std::size_t>( s ) ] ) {
        tr = def;
    }
}

void stay( table_t &t, FSM_STATE s, std::initializer_list<FSM_EVENT> events ) {
    for( auto e: events ) {
        at( t, s, e ) = { s, {}, std::nullopt };
    }
}

// Teardown to Idle. Routes are only withdrawn when leaving Established.
fsm_transition teardown( FSM_STATE from, bool notify, std::optional<bgp_notification_msg> notification = std::nullopt ) {
    fsm_transition tr { FSM_STATE::IDLE, {}, std::move( notification ) };
    if( notify ) {
        tr.actions.push_back( A::SEND_NOTIFICATION );
    }
    tr.actions.push_back( A::STOP_TIMERS );
    tr.actions.push_back( A::DROP_CONNECTION );
    if( from == FSM_STATE::ESTABLISHED ) {
        tr.actions.push_back( A::ROUTES_DOWN );
    }
    tr.actions.push_back( A::INCREMENT_RETRY_COUNTER );
    tr.actions.push_back( A::START_CONNECT_RETRY );
    return tr;
}

fsm_transition manual_stop( FSM_STATE from ) {
    fsm_transition tr { FSM_STATE::IDLE, {}, std::nullopt };
    bool connected = from == FSM_STATE::OPENSENT || from == FSM_STATE::OPENCONFIRM || from == FSM_STATE::ESTABLISHED;
    if( connected ) {
        tr.actions.push_back( A::SEND_NOTIFICATION );
        tr.notification = ADMIN_SHUTDOWN;
    }
    tr.actions.push_back( A::STOP_TIMERS );
    tr.actions.push_back( A::DROP_CONNECTION );
    if( from == FSM_STATE::ESTABLISHED ) {
        tr.actions.push_back( A::ROUTES_DOWN );
    }
    tr.actions.push_back( A::RESET_RETRY_COUNTER );
    return tr;
}

void fill_session_state( table_t &t, FSM_STATE s, FSM_ERR unexpected ) {
    fill_row( t, s, teardown( s, true, bgp_notification_msg { BGP_ERR::FSM, unexpected } ) );

    stay( t, s, {
        FSM_EVENT::MANUAL_START,
        FSM_EVENT::MANUAL_START_PASSIVE,
        FSM_EVENT::AUTOMATIC_START,
        FSM_EVENT::AUTOMATIC_START_PASSIVE,
        FSM_EVENT::TCP_CONNECTION_CONFIRMED,
    });
    at( t, s, FSM_EVENT::MANUAL_STOP ) = manual_stop( s );
    at( t, s, FSM_EVENT::HOLD_TIMER_EXPIRES ) = teardown( s, true, HOLD_EXPIRED );
    // codec errors carry their own NOTIFICATION
    at( t, s, FSM_EVENT::BGP_HEADER_ERR ) = teardown( s, true );
    at( t, s, FSM_EVENT::NOTIF_MSG ) = teardown( s, false );
    at( t, s, FSM_EVENT::TCP_CONNECTION_FAILS ) = teardown( s, false );
}

table_t build_table() {
    table_t t;

    // Idle
    fill_row( t, FSM_STATE::IDLE, { FSM_STATE::IDLE, {}, std::nullopt } );
    for( auto e: { FSM_EVENT::MANUAL_START, FSM_EVENT::AUTOMATIC_START } ) {
        at( t, FSM_STATE::IDLE, e ) = { FSM_STATE::CONNECT, { A::INITIATE_CONNECT, A::START_CONNECT_RETRY }, std::nullopt };
    }
    for( auto e: { FSM_EVENT::MANUAL_START_PASSIVE, FSM_EVENT::AUTOMATIC_START_PASSIVE } ) {
        at( t, FSM_STATE::IDLE, e ) = { FSM_STATE::ACTIVE, {}, std::nullopt };
    }

    // Connect and Active
    for( auto s: { FSM_STATE::CONNECT, FSM_STATE::ACTIVE } ) {
        fill_row( t, s, teardown( s, false ) );
        stay( t, s, {
            FSM_EVENT::MANUAL_START,
            FSM_EVENT::MANUAL_START_PASSIVE,
            FSM_EVENT::AUTOMATIC_START,
            FSM_EVENT::AUTOMATIC_START_PASSIVE,
        });
        at( t, s, FSM_EVENT::MANUAL_STOP ) = manual_stop( s );
        at( t, s, FSM_EVENT::TCP_CONNECTION_CONFIRMED ) = { FSM_STATE::OPENSENT, { A::STOP_CONNECT_RETRY, A::SEND_OPEN, A::ARM_HOLD_LARGE }, std::nullopt };
    }
    at( t, FSM_STATE::CONNECT, FSM_EVENT::CONNECT_RETRY_TIMER_EXPIRES ) = { FSM_STATE::CONNECT, { A::DROP_CONNECTION, A::INITIATE_CONNECT, A::START_CONNECT_RETRY }, std::nullopt };
    at( t, FSM_STATE::ACTIVE, FSM_EVENT::CONNECT_RETRY_TIMER_EXPIRES ) = { FSM_STATE::CONNECT, { A::INITIATE_CONNECT, A::START_CONNECT_RETRY }, std::nullopt };
    at( t, FSM_STATE::ACTIVE, FSM_EVENT::TCP_CONNECTION_FAILS ) = { FSM_STATE::ACTIVE, { A::DROP_CONNECTION }, std::nullopt };

    // OpenSent
    fill_session_state( t, FSM_STATE::OPENSENT, FSM_ERR::OPEN_SENT );
    at( t, FSM_STATE::OPENSENT, FSM_EVENT::BGP_OPEN ) = { FSM_STATE::OPENCONFIRM, { A::STOP_CONNECT_RETRY, A::NEGOTIATE_TIMERS, A::SEND_KEEPALIVE }, std::nullopt };
    at( t, FSM_STATE::OPENSENT, FSM_EVENT::BGP_OPEN_MSG_ERR ) = teardown( FSM_STATE::OPENSENT, true );

    // OpenConfirm
    fill_session_state( t, FSM_STATE::OPENCONFIRM, FSM_ERR::OPEN_CONFIRM );
    at( t, FSM_STATE::OPENCONFIRM, FSM_EVENT::BGP_OPEN_MSG_ERR ) = teardown( FSM_STATE::OPENCONFIRM, true );
    at( t, FSM_STATE::OPENCONFIRM, FSM_EVENT::KEEPALIVE_MSG ) = { FSM_STATE::ESTABLISHED, { A::RESTART_HOLD, A::RESET_RETRY_COUNTER, A::ROUTES_UP }, std::nullopt };
    at( t, FSM_STATE::OPENCONFIRM, FSM_EVENT::KEEPALIVE_TIMER_EXPIRES ) = { FSM_STATE::OPENCONFIRM, { A::SEND_KEEPALIVE, A::RESTART_KEEPALIVE }, std::nullopt };

    // Established
    fill_session_state( t, FSM_STATE::ESTABLISHED, FSM_ERR::ESTABLISHED );
    at( t, FSM_STATE::ESTABLISHED, FSM_EVENT::UPDATE_MSG_ERR ) = teardown( FSM_STATE::ESTABLISHED, true );
    at( t, FSM_STATE::ESTABLISHED, FSM_EVENT::KEEPALIVE_MSG ) = { FSM_STATE::ESTABLISHED, { A::RESTART_HOLD }, std::nullopt };
    at( t, FSM_STATE::ESTABLISHED, FSM_EVENT::UPDATE_MSG ) = { FSM_STATE::ESTABLISHED, { A::RESTART_HOLD, A::PROCESS_UPDATE }, std::nullopt };
    at( t, FSM_STATE::ESTABLISHED, FSM_EVENT::KEEPALIVE_TIMER_EXPIRES ) = { FSM_STATE::ESTABLISHED, { A::SEND_KEEPALIVE, A::RESTART_KEEPALIVE }, std::nullopt };

    return t;
}

}

bool fsm_transition::has( FSM_ACTION action ) const {
    return std::find( actions.begin(), actions.end(), action ) != actions.end();
}

const fsm_transition& fsm_lookup( FSM_STATE state, FSM_EVENT event ) {
    static const table_t table = build_table();
    return table[ static_cast<std::size_t>( state ) ][ static_cast<std::size_t>( event ) ];
}
