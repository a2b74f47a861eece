//
// Per call state of one two phase WebHDFS write
//

#include "TransferSession.h"
#include <stdexcept>
#include <utility>

auto transferPhaseToString(eTransferPhase phase) -> std::string {
    switch (phase) {
        case eTransferPhase::NEGOTIATING:
            return "NEGOTIATING";
        case eTransferPhase::REDIRECTED:
            return "REDIRECTED";
        case eTransferPhase::IMMEDIATE:
            return "IMMEDIATE";
        case eTransferPhase::TRANSFERRING:
            return "TRANSFERRING";
        case eTransferPhase::DONE:
            return "DONE";
        case eTransferPhase::FAILED:
            return "FAILED";
    }

    return "UNKNOWN";
}

TransferSession::TransferSession(std::string targetPath) : targetPath(std::move(targetPath)) {
    history.push_back(phase);
}

void TransferSession::redirect(std::string location) {
    advance(eTransferPhase::REDIRECTED);
    redirectLocation = std::move(location);
}

void TransferSession::immediate() {
    advance(eTransferPhase::IMMEDIATE);
}

void TransferSession::beginTransfer() {
    advance(eTransferPhase::TRANSFERRING);
}

void TransferSession::complete() {
    advance(eTransferPhase::DONE);
}

void TransferSession::fail() {
    // Failing twice is harmless, a completion chain may report the same error from more than one place
    if (phase == eTransferPhase::FAILED) {
        return;
    }
    advance(eTransferPhase::FAILED);
}

void TransferSession::advance(eTransferPhase next) {
    bool allowed = false;

    switch (phase) {
        case eTransferPhase::NEGOTIATING:
            allowed = next == eTransferPhase::REDIRECTED || next == eTransferPhase::IMMEDIATE ||
                      next == eTransferPhase::FAILED;
            break;
        case eTransferPhase::REDIRECTED:
            allowed = next == eTransferPhase::TRANSFERRING || next == eTransferPhase::FAILED;
            break;
        case eTransferPhase::IMMEDIATE:
        case eTransferPhase::TRANSFERRING:
            allowed = next == eTransferPhase::DONE || next == eTransferPhase::FAILED;
            break;
        case eTransferPhase::DONE:
        case eTransferPhase::FAILED:
            allowed = false;
            break;
    }

    if (!allowed) {
        throw std::logic_error(
                "Illegal transfer transition " + transferPhaseToString(phase) + " -> " + transferPhaseToString(next)
                + " for " + targetPath
        );
    }

    phase = next;
    history.push_back(phase);
}
