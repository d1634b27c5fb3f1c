#pragma once

#include "transport.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/** @struct RefAdvertisement
 *  @brief What a remote advertised during ref discovery.
 */
struct RefAdvertisement {
    std::map<std::string, std::string> refs;  ///< Ref name -> 40-hex address, excluding HEAD and peeled tags.
    std::string head;                         ///< Address HEAD resolves to; the commit to check out.
    std::optional<std::string> headTarget;    ///< Branch HEAD points at, when it can be determined.
    std::vector<std::string> capabilities;    ///< Capabilities from the first ref line.
};

/**
 * @brief Parses a smart-HTTP `info/refs` advertisement.
 *
 * Accepts an optional "# service=git-upload-pack" banner and flush, then one
 * pkt-line per ref. Peeled tag lines ("^{}") and the empty-repository
 * placeholder ("capabilities^{}") are not refs.
 *
 * @param body The raw response body.
 * @param remoteUrl Used in error messages only.
 * @throws ProtocolError if the body is not a well-formed advertisement.
 * @throws EmptyRepository if no refs are advertised.
 */
RefAdvertisement parseRefAdvertisement(const std::string& body, const std::string& remoteUrl);

/**
 * @class RefProtocolClient
 * @brief Client side of the smart HTTP upload-pack exchange.
 *
 * One instance performs one clone: discoverRefs() moves it from IDLE to
 * REFS_DISCOVERED, fetchPack() from REFS_DISCOVERED to DONE. Any error moves
 * it to FAILED, after which it cannot be used again.
 */
class RefProtocolClient {
public:
    enum class State {
        IDLE,
        REFS_DISCOVERED,
        DONE,
        FAILED
    };

    explicit RefProtocolClient(Transport& transport);

    /**
     * @brief Fetches `<url>/info/refs?service=git-upload-pack` and parses the advertisement.
     * @throws RemoteUnreachable on transport failure or a non-2xx status.
     * @throws ProtocolError on an unparseable advertisement or when not IDLE.
     * @throws EmptyRepository if the remote has no refs.
     */
    RefAdvertisement discoverRefs(const std::string& remoteUrl);

    /**
     * @brief Requests a pack containing everything reachable from `wantedShas`.
     *
     * Sends the want lines, a flush and "done" to `<url>/git-upload-pack` and
     * returns the raw packfile (header, entries and trailing checksum).
     *
     * @throws RemoteUnreachable on transport failure or a non-2xx status.
     * @throws ProtocolError on a malformed response, a remote error, or when refs
     *         have not been discovered.
     */
    std::vector<std::byte> fetchPack(const std::string& remoteUrl, const std::vector<std::string>& wantedShas);

    State state() const { return m_state; }

private:
    Transport& m_transport;
    State m_state;
    std::vector<std::string> m_capabilities;

    std::string requestCapabilities() const;
    bool hasCapability(const std::string& name) const;
};
