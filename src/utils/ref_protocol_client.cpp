#include "../include/ref_protocol_client.h"
#include "../include/pkt_line_utils.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/repository.h"
#include "../include/sha1_utils.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>

namespace {

std::string normalizeUrl(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string packetText(const Packet& packet) {
    std::string text(reinterpret_cast<const char*>(packet.payload.data()), packet.payload.size());
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

void checkResponse(const HttpResponse& response, const std::string& url) {
    if (!response.error.empty()) {
        throw RemoteUnreachable(url + ": " + response.error);
    }
    if (response.statusCode < 200 || response.statusCode >= 300) {
        throw RemoteUnreachable(url + ": HTTP status " + std::to_string(response.statusCode));
    }
}

std::vector<std::string> splitCapabilities(const std::string& text) {
    std::istringstream stream(text);
    return {std::istream_iterator<std::string>(stream), std::istream_iterator<std::string>()};
}

// Chooses the branch HEAD points at and the address to check out.
void resolveHead(RefAdvertisement& advertisement, const std::string& remoteUrl) {
    for (const auto& capability : advertisement.capabilities) {
        const std::string prefix = "symref=HEAD:";
        if (capability.rfind(prefix, 0) == 0) {
            const std::string target = capability.substr(prefix.size());
            if (advertisement.refs.count(target) != 0) {
                advertisement.headTarget = target;
            }
        }
    }

    if (!advertisement.headTarget) {
        // Without a symref, guess the branch: main, then master, then any branch at HEAD.
        std::vector<std::string> candidates = {"refs/heads/main", "refs/heads/master"};
        for (const auto& [name, sha] : advertisement.refs) {
            if (name.rfind("refs/heads/", 0) == 0) {
                candidates.push_back(name);
            }
        }
        for (const auto& candidate : candidates) {
            auto it = advertisement.refs.find(candidate);
            if (it != advertisement.refs.end() &&
                (advertisement.head.empty() || it->second == advertisement.head)) {
                advertisement.headTarget = candidate;
                break;
            }
        }
    }

    if (advertisement.head.empty()) {
        if (advertisement.headTarget) {
            advertisement.head = advertisement.refs.at(*advertisement.headTarget);
        } else if (!advertisement.refs.empty()) {
            advertisement.head = advertisement.refs.begin()->second;
        } else {
            throw EmptyRepository(remoteUrl);
        }
    }
}

} // namespace

RefAdvertisement parseRefAdvertisement(const std::string& body, const std::string& remoteUrl) {
    std::istringstream data_stream(body);
    PktLineReader pktLineReader(data_stream);
    RefAdvertisement advertisement;
    bool firstRefLine = true;

    auto packet = pktLineReader.readNextPacket();
    if (packet && packet->type == PacketType::DATA && packetText(*packet).rfind("# service=", 0) == 0) {
        const std::string banner = packetText(*packet);
        if (banner != "# service=" + std::string(constants::UPLOAD_PACK_SERVICE)) {
            throw ProtocolError("unexpected service banner '" + banner + "'");
        }
        packet = pktLineReader.readNextPacket();
        if (packet && packet->type == PacketType::FLUSH) {
            packet = pktLineReader.readNextPacket();
        }
    }

    for (; packet && packet->type != PacketType::FLUSH; packet = pktLineReader.readNextPacket()) {
        if (packet->type != PacketType::DATA) {
            throw ProtocolError("unexpected delimiter in ref advertisement");
        }
        std::string line = packetText(*packet);

        if (line.rfind("ERR ", 0) == 0) {
            throw ProtocolError("remote reported: " + line.substr(4));
        }
        if (line == "version 1") {
            continue;
        }

        // The first ref line carries "\0<capabilities>".
        const size_t nul = line.find('\0');
        if (nul != std::string::npos) {
            if (firstRefLine) {
                advertisement.capabilities = splitCapabilities(line.substr(nul + 1));
            }
            line.resize(nul);
        }
        firstRefLine = false;

        const size_t space = line.find(' ');
        if (space == std::string::npos) {
            throw ProtocolError("ref line without name: '" + line + "'");
        }
        const std::string sha = line.substr(0, space);
        const std::string name = line.substr(space + 1);
        if (!isSha1Hex(sha) || name.empty()) {
            throw ProtocolError("invalid ref line: '" + line + "'");
        }

        if (name == "capabilities^{}") {
            continue; // Placeholder sent by a repository without refs.
        }
        if (name.size() > 3 && name.compare(name.size() - 3, 3, "^{}") == 0) {
            continue; // Peeled target of an annotated tag.
        }
        if (name == constants::HEAD_FILE_NAME) {
            advertisement.head = normalizeSha1Hex(sha);
            continue;
        }
        if (!isValidRefName(name)) {
            throw ProtocolError("invalid ref name '" + name + "'");
        }
        advertisement.refs[name] = normalizeSha1Hex(sha);
    }

    if (advertisement.refs.empty() && advertisement.head.empty()) {
        throw EmptyRepository(remoteUrl);
    }
    resolveHead(advertisement, remoteUrl);
    return advertisement;
}

RefProtocolClient::RefProtocolClient(Transport& transport) : m_transport(transport), m_state(State::IDLE) {}

RefAdvertisement RefProtocolClient::discoverRefs(const std::string& remoteUrl) {
    if (m_state != State::IDLE) {
        throw ProtocolError("ref discovery already performed");
    }
    try {
        const std::string baseUrl = normalizeUrl(remoteUrl);
        const std::string discoveryUrl = baseUrl + "/info/refs?service=" + std::string(constants::UPLOAD_PACK_SERVICE);

        const HttpResponse response = m_transport.get(discoveryUrl, {});
        checkResponse(response, discoveryUrl);

        RefAdvertisement advertisement = parseRefAdvertisement(response.body, baseUrl);
        m_capabilities = advertisement.capabilities;
        m_state = State::REFS_DISCOVERED;
        return advertisement;
    } catch (const std::exception&) {
        m_state = State::FAILED;
        throw;
    }
}

std::vector<std::byte> RefProtocolClient::fetchPack(const std::string& remoteUrl,
                                                    const std::vector<std::string>& wantedShas) {
    if (m_state != State::REFS_DISCOVERED) {
        throw ProtocolError("pack requested before ref discovery");
    }
    try {
        if (wantedShas.empty()) {
            throw std::invalid_argument("fetchPack needs at least one wanted object");
        }

        // --- Negotiation request: want lines, flush, done ---
        std::stringstream requestBodyStream;
        std::set<std::string> sent;
        for (const auto& wanted : wantedShas) {
            const std::string sha = normalizeSha1Hex(wanted);
            if (!sent.insert(sha).second) {
                continue;
            }
            std::string wantLine = "want " + sha;
            if (sent.size() == 1) {
                wantLine += requestCapabilities();
            }
            requestBodyStream << createPktLine(wantLine + "\n");
        }
        requestBodyStream << createPktLine("");       // Flush packet
        requestBodyStream << createPktLine("done\n"); // We are done specifying what we want.

        const std::string packUrl = normalizeUrl(remoteUrl) + "/" + std::string(constants::UPLOAD_PACK_SERVICE);
        const HttpResponse response = m_transport.post(
            packUrl, requestBodyStream.str(),
            {{"Content-Type", "application/x-git-upload-pack-request"},
             {"Accept", "application/x-git-upload-pack-result"}});
        checkResponse(response, packUrl);

        std::vector<std::byte> packfile;
        if (hasCapability("side-band-64k")) {
            packfile = extractPackfileData(response.body);
        } else {
            // Without side-band the acknowledgements are pkt-lines and the pack follows raw.
            std::istringstream data_stream(response.body);
            PktLineReader pktLineReader(data_stream);
            auto packet = pktLineReader.readNextPacket();
            if (!packet || packet->type != PacketType::DATA) {
                throw ProtocolError("missing acknowledgement before pack data");
            }
            const std::string ack = packetText(*packet);
            if (ack.rfind("ERR ", 0) == 0) {
                throw ProtocolError("remote reported: " + ack.substr(4));
            }
            const std::string rest((std::istreambuf_iterator<char>(data_stream)), std::istreambuf_iterator<char>());
            auto bytes = std::as_bytes(std::span{rest.data(), rest.size()});
            packfile.assign(bytes.begin(), bytes.end());
        }

        const auto signature = constants::PACK_SIGNATURE;
        if (packfile.size() < signature.size() ||
            !std::equal(signature.begin(), signature.end(), packfile.begin(),
                        [](char c, std::byte b) { return std::byte(c) == b; })) {
            throw ProtocolError("response from " + packUrl + " does not contain a packfile");
        }

        m_state = State::DONE;
        return packfile;
    } catch (const std::exception&) {
        m_state = State::FAILED;
        throw;
    }
}

bool RefProtocolClient::hasCapability(const std::string& name) const {
    return std::find(m_capabilities.begin(), m_capabilities.end(), name) != m_capabilities.end();
}

// Only capabilities the server advertised may be requested; the agent is always allowed.
std::string RefProtocolClient::requestCapabilities() const {
    std::string requested;
    for (const auto& capability : splitCapabilities(std::string(constants::FETCH_CAPABILITIES))) {
        if (hasCapability(capability)) {
            requested += " " + capability;
        }
    }
    requested += " agent=" + std::string(constants::AGENT);
    return requested;
}
