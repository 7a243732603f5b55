// ConnectionStateMachine.cpp

#include "meterlink/Network/ConnectionStateMachine.h"

namespace MeterLink {

using S = ConnectionState;
using E = ConnectionEvent;
using F = ConnectionEffect;

const char* connectionEventToString(ConnectionEvent event) {
    switch (event) {
        case E::Accepted: return "accepted";
        case E::AuthRequested: return "authRequested";
        case E::AuthMalformed: return "authMalformed";
        case E::TokenAccepted: return "tokenAccepted";
        case E::TokenRejected: return "tokenRejected";
        case E::PingReceived: return "pingReceived";
        case E::DisconnectReceived: return "disconnectReceived";
        case E::UnexpectedMessage: return "unexpectedMessage";
        case E::TransportClosed: return "transportClosed";
        case E::LocalDisconnect: return "localDisconnect";
        case E::IdleTimeout: return "idleTimeout";
        default: return "unknown";
    }
}

const char* connectionEffectToString(ConnectionEffect effect) {
    switch (effect) {
        case F::Register: return "register";
        case F::ValidateToken: return "validateToken";
        case F::Promote: return "promote";
        case F::SendAuthSuccess: return "sendAuthSuccess";
        case F::InvalidateCredential: return "invalidateCredential";
        case F::SendAuthFailure: return "sendAuthFailure";
        case F::CloseAfterGrace: return "closeAfterGrace";
        case F::SendPong: return "sendPong";
        case F::SendDisconnect: return "sendDisconnect";
        case F::CloseTransport: return "closeTransport";
        case F::Deregister: return "deregister";
        default: return "unknown";
    }
}

Transition ConnectionStateMachine::next(ConnectionState state, ConnectionEvent event) {
    if (state == S::Closed) {
        return {S::Closed, {}};
    }

    // Первое входящее сообщение переводит Connecting -> Authenticating
    const S awaiting = (state == S::Connecting) ? S::Authenticating : state;

    switch (event) {
        case E::Accepted:
            if (state == S::Connecting) {
                return {S::Connecting, {F::Register}};
            }
            return {state, {}};

        case E::AuthRequested:
            if (state == S::Authenticated) {
                return {state, {}};  // Повторный auth игнорируется
            }
            return {S::Authenticating, {F::ValidateToken}};

        case E::AuthMalformed:
            if (state == S::Authenticated) {
                return {state, {}};
            }
            return {S::Closed, {F::SendAuthFailure, F::CloseAfterGrace, F::Deregister}};

        case E::TokenAccepted:
            if (state != S::Authenticating) {
                return {state, {}};
            }
            return {S::Authenticated, {F::Promote, F::SendAuthSuccess, F::InvalidateCredential}};

        case E::TokenRejected:
            if (state != S::Authenticating) {
                return {state, {}};
            }
            return {S::Closed, {F::SendAuthFailure, F::CloseAfterGrace, F::Deregister}};

        case E::PingReceived:
            return {awaiting, {F::SendPong}};

        case E::UnexpectedMessage:
            return {awaiting, {}};

        case E::DisconnectReceived:
        case E::IdleTimeout:
            return {S::Closed, {F::CloseTransport, F::Deregister}};

        case E::TransportClosed:
            return {S::Closed, {F::Deregister, F::CloseTransport}};

        case E::LocalDisconnect:
            return {S::Closed, {F::SendDisconnect, F::CloseTransport, F::Deregister}};
    }

    return {state, {}};
}

} // namespace MeterLink
