//
// Per call state of one two phase WebHDFS write
//

#ifndef BIGDATA_GATEWAY_TRANSFERSESSION_H
#define BIGDATA_GATEWAY_TRANSFERSESSION_H

#include <optional>
#include <string>
#include <vector>

enum class eTransferPhase {
    NEGOTIATING,
    REDIRECTED,
    IMMEDIATE,
    TRANSFERRING,
    DONE,
    FAILED
};

auto transferPhaseToString(eTransferPhase phase) -> std::string;

/*
 * A write starts NEGOTIATING with the name node. The name node either hands off to a data node (REDIRECTED, then
 * TRANSFERRING while the payload is sent) or accepts the write itself (IMMEDIATE). Either branch ends DONE once the
 * status confirmation succeeds, or FAILED from any non terminal phase. Sessions are never reused.
 */
class TransferSession {
public:
    explicit TransferSession(std::string targetPath);

    void redirect(std::string location);
    void immediate();
    void beginTransfer();
    void complete();
    void fail();

    [[nodiscard]] auto getTargetPath() const -> const std::string & { return targetPath; }

    [[nodiscard]] auto getRedirectLocation() const -> const std::optional<std::string> & { return redirectLocation; }

    [[nodiscard]] auto getPhase() const -> eTransferPhase { return phase; }

    // Every phase the session has been in, in order
    [[nodiscard]] auto getHistory() const -> const std::vector<eTransferPhase> & { return history; }

    [[nodiscard]] auto isTerminal() const -> bool {
        return phase == eTransferPhase::DONE || phase == eTransferPhase::FAILED;
    }

private:
    std::string targetPath;
    std::optional<std::string> redirectLocation;
    eTransferPhase phase = eTransferPhase::NEGOTIATING;
    std::vector<eTransferPhase> history;

    void advance(eTransferPhase next);
};

#endif //BIGDATA_GATEWAY_TRANSFERSESSION_H
