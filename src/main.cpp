#include "card_catalog.hpp"
#include "clue_protocol.hpp"
#include "local_disclosure_oracle.hpp"
#include "plaintext_backend.hpp"
#include "protocol_error.hpp"
#include "sealed_backend.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bc;

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

std::uint64_t parseUnsigned(const std::string& text, const std::string& what) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) {
            return ch >= '0' && ch <= '9';
        })) {
        throw std::invalid_argument(what + " must be an unsigned integer: " + text);
    }
    return std::stoull(text);
}

std::uint64_t nowSeconds() {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

ComputeBackendPtr makeBackend(const std::string& name) {
    if (name == "plaintext") {
        return std::make_shared<PlaintextBackend>();
    }
    if (name == "sealed") {
        return std::make_shared<SealedBackend>();
    }
    throw std::invalid_argument("BC_BACKEND must be \"plaintext\" or \"sealed\", got " + name);
}

// Accepts a deck index or a card name with '_' standing in for spaces ("Lead_Pipe").
std::uint64_t parseCard(ClueField field, std::string token) {
    if (!token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char ch) {
            return ch >= '0' && ch <= '9';
        })) {
        std::uint64_t index = std::stoull(token);
        if (index >= cardCount(field)) {
            throw std::out_of_range(std::string("no ") + toString(field) + " card " + token);
        }
        return index;
    }
    std::replace(token.begin(), token.end(), '_', ' ');
    auto found = findCard(field, token);
    if (!found) {
        throw std::invalid_argument(std::string("unknown ") + toString(field) + ": " + token);
    }
    return *found;
}

ClueTriple encryptTriple(ComputeBackend& backend, const std::vector<std::string>& args, std::size_t offset) {
    if (args.size() < offset + kClueFieldCount) {
        throw std::invalid_argument("expected <weapon> <room> <suspect>");
    }
    ClueTriple triple;
    for (ClueField field : kClueFields) {
        std::size_t i = fieldIndex(field);
        triple[i] = backend.encrypt(parseCard(field, args[offset + i]));
    }
    return triple;
}

void requireArgs(const std::vector<std::string>& args, std::size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  open                                    open a new batch (owner)\n"
              << "  close <batch>                           close a batch (owner)\n"
              << "  provider add|remove <id>                manage providers (owner)\n"
              << "  pause | unpause                         circuit breaker (owner)\n"
              << "  cooldown <seconds>                      set the shared cooldown (owner)\n"
              << "  bump                                    void all pending disclosures (owner)\n"
              << "  submit <who> <batch> <weapon> <room> <suspect>\n"
              << "  accuse <who> <batch> <weapon> <room> <suspect>\n"
              << "  solve <who> <batch>                     request the raw case file\n"
              << "  deliver                                 let the oracle answer and settle replies\n"
              << "  batch <batch> | stats | accusations | audit\n"
              << "  help | quit\n";
}

void printEvent(const ProtocolEvent& event) {
    if (event.kind == ProtocolEventKind::DisclosureRequested) {
        std::cout << "  [event] disclosure requested: request=" << event.requestId
                  << " batch=" << event.batchId << " commitment=" << event.commitmentHash << "\n";
        return;
    }
    std::cout << "  [event] disclosure settled: request=" << event.requestId
              << " batch=" << event.batchId << "\n";
}

void printResult(const DisclosureResult& result) {
    if (result.kind == DisclosureKind::Accusation) {
        std::cout << "Accusation (request " << result.requestId << ", batch " << result.batchId
                  << ") is " << (result.accusationCorrect ? "CORRECT" : "incorrect") << "\n";
        return;
    }
    std::cout << "Batch " << result.batchId << " case file:";
    for (ClueField field : kClueFields) {
        std::cout << " " << toString(field) << "="
                  << describeCard(field, result.solution[fieldIndex(field)]);
    }
    std::cout << "\n";
}

} // namespace

int main() {
    ProtocolConfig cfg;
    cfg.deploymentId = envOr("BC_DEPLOYMENT_ID", "local-console");
    std::string owner = envOr("BC_OWNER", "owner");
    std::string backendName = envOr("BC_BACKEND", "plaintext");

    std::shared_ptr<LocalDisclosureOracle> oracle;
    std::unique_ptr<ClueProtocol> protocol;
    ComputeBackendPtr backend;
    try {
        applyEnvironmentOverrides(cfg);
        validateConfig(cfg);
        backend = makeBackend(backendName);
        auto channel = std::make_shared<DisclosureChannel>();
        oracle = std::make_shared<LocalDisclosureOracle>(backend, channel, buildIdentityTag(cfg));
        protocol = std::make_unique<ClueProtocol>(cfg, owner, backend, oracle);
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }
    protocol->subscribe(printEvent);

    std::cout << "blindclue console (" << backend->label() << " backend)\n";
    std::cout << "Identity tag: " << protocol->identityTag() << "\n";
    std::cout << "Oracle public key: " << oracle->publicKeyHex() << "\n";
    std::cout << "Owner: " << owner << " (set BC_OWNER to override); type 'help' for commands\n";

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::vector<std::string> args;
        std::string token;
        while (iss >> token) {
            args.push_back(token);
        }
        if (args.empty()) {
            continue;
        }
        const std::string& cmd = args[0];
        if (cmd == "quit" || cmd == "exit") {
            break;
        }

        try {
            std::uint64_t now = nowSeconds();
            if (cmd == "help") {
                printHelp();
            } else if (cmd == "open") {
                std::cout << "Opened batch " << protocol->openBatch(owner) << "\n";
            } else if (cmd == "close") {
                requireArgs(args, 2, "close <batch>");
                protocol->closeBatch(owner, parseUnsigned(args[1], "batch"));
                std::cout << "Closed batch " << args[1] << "\n";
            } else if (cmd == "provider") {
                requireArgs(args, 3, "provider add|remove <id>");
                bool changed = args[1] == "add" ? protocol->addProvider(owner, args[2])
                                                : protocol->removeProvider(owner, args[2]);
                std::cout << (changed ? "Updated providers\n" : "No change\n");
            } else if (cmd == "pause") {
                protocol->pause(owner);
                std::cout << "Paused\n";
            } else if (cmd == "unpause") {
                protocol->unpause(owner);
                std::cout << "Unpaused\n";
            } else if (cmd == "cooldown") {
                requireArgs(args, 2, "cooldown <seconds>");
                protocol->setCooldownSeconds(owner, parseUnsigned(args[1], "seconds"));
                std::cout << "Cooldown is now " << protocol->cooldownSeconds() << "s\n";
            } else if (cmd == "bump") {
                std::cout << "Protocol version is now " << protocol->bumpVersion(owner) << "\n";
            } else if (cmd == "submit") {
                requireArgs(args, 6, "submit <who> <batch> <weapon> <room> <suspect>");
                BatchId batchId = parseUnsigned(args[2], "batch");
                protocol->submitContribution(args[1], batchId, encryptTriple(*backend, args, 3), now);
                std::cout << "Contribution from " << args[1] << " accepted into batch " << batchId
                          << " (" << protocol->batch(batchId).submissionCount << " so far)\n";
            } else if (cmd == "accuse") {
                requireArgs(args, 6, "accuse <who> <batch> <weapon> <room> <suspect>");
                BatchId batchId = parseUnsigned(args[2], "batch");
                RequestId id = protocol->submitAccusation(
                    args[1], batchId, encryptTriple(*backend, args, 3), now);
                std::cout << "Accusation queued as request " << id << "\n";
            } else if (cmd == "solve") {
                requireArgs(args, 3, "solve <who> <batch>");
                RequestId id = protocol->requestSolution(args[1], parseUnsigned(args[2], "batch"), now);
                std::cout << "Solution disclosure queued as request " << id << "\n";
            } else if (cmd == "deliver") {
                std::size_t answered = oracle->processPending();
                std::cout << "Oracle answered " << answered << " request(s)\n";
                while (auto reply = oracle->channel()->takeReply()) {
                    try {
                        printResult(protocol->settle(*reply));
                    } catch (const ProtocolError& ex) {
                        std::cerr << "Settlement of request " << reply->requestId
                                  << " rejected: " << ex.what() << "\n";
                    }
                }
            } else if (cmd == "batch") {
                requireArgs(args, 2, "batch <batch>");
                Batch b = protocol->batch(parseUnsigned(args[1], "batch"));
                std::cout << "Batch " << b.id << ": " << (b.isOpen ? "open" : "closed") << ", "
                          << b.submissionCount << " submission(s), " << b.accusers.size()
                          << " accusation(s), " << b.requestedAddresses.size()
                          << " solution request(s)\n";
            } else if (cmd == "stats") {
                CasebookStats s = protocol->stats();
                std::cout << "Accusations: " << s.total << " total, " << s.correct << " correct, "
                          << s.incorrect << " incorrect, " << s.pending << " pending, " << s.voided
                          << " voided\n";
            } else if (cmd == "accusations") {
                for (const auto& record : protocol->accusations()) {
                    std::cout << "  request " << record.requestId << ": " << record.player
                              << " on batch " << record.batchId << " -> " << toString(record.status)
                              << "\n";
                }
            } else if (cmd == "audit") {
                auto records = protocol->auditRecords();
                for (std::size_t i = 0; i < records.size(); ++i) {
                    std::cout << "  [" << i << "] " << records[i] << "\n";
                }
                std::cout << "Merkle root: " << protocol->auditRoot() << "\n";
            } else {
                std::cerr << "Unknown command '" << cmd << "'; type 'help'\n";
            }
        } catch (const std::exception& ex) {
            std::cerr << "Error: " << ex.what() << "\n";
        }
    }
    return 0;
}
