#include "crosslock/chain.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace crosslock {

// ============================================================================
// ChainConfig Implementation
// ============================================================================

ChainConfig ChainConfig::from_file(const std::string& path) {
    ChainConfig config;
    std::ifstream file(path);
    if (!file.is_open()) {
        logging::warn("CONFIG", "Cannot open " + path + ", using defaults");
        return config;
    }

    std::string line;
    std::string current_section = "chain";

    auto trim = [](const std::string& str) {
        auto first = str.find_first_not_of(" \t\r\n");
        if (std::string::npos == first) return std::string();
        auto last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    };

    auto to_uint64 = [](const std::string& s) {
        // stoull accepts a sign and trailing text, neither is a count
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            logging::warn("CONFIG", "Ignoring non-numeric value " + s);
            return 0ULL;
        }
        try {
            return std::stoull(s);
        } catch (const std::out_of_range&) {
            logging::warn("CONFIG", "Ignoring out-of-range value " + s);
            return 0ULL;
        }
    };
    auto to_uint32 = [&](const std::string& s) {
        uint64_t value = to_uint64(s);
        if (value > std::numeric_limits<uint32_t>::max()) {
            logging::warn("CONFIG", "Ignoring value beyond 32 bits " + s);
            return uint32_t{0};
        }
        return static_cast<uint32_t>(value);
    };
    auto to_address = [&](const std::string& key, const std::string& s) {
        auto addr = Address::from_hex(s);
        if (!addr) {
            logging::warn("CONFIG", "Ignoring malformed address for " + key);
        }
        return addr.value_or(Address{});
    };

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val_str = trim(line.substr(eq + 1));

        // Remove quotes if present
        if (val_str.size() >= 2 && val_str.front() == '"' && val_str.back() == '"') {
            val_str = val_str.substr(1, val_str.size() - 2);
        }

        if (current_section == "chain") {
            if (key == "name") config.name = val_str;
            else if (key == "chain_id") config.chain_id = to_uint64(val_str);
            else if (key == "data_dir") config.data_dir = val_str;
            else if (key == "persistent") config.persistent = (val_str == "true");
        }
        else if (current_section == "factory") {
            if (key == "owner") config.factory.owner = to_address(key, val_str);
            else if (key == "order_protocol") config.factory.order_protocol = to_address(key, val_str);
            else if (key == "access_token") config.factory.access_token = to_address(key, val_str);
            else if (key == "src_rescue_delay") config.factory.src_rescue_delay = to_uint32(val_str);
            else if (key == "dst_rescue_delay") config.factory.dst_rescue_delay = to_uint32(val_str);
        }
        else if (current_section == "timelocks") {
            if (key == "src_public_withdrawal_gap") config.factory.gaps.src_public_withdrawal = to_uint32(val_str);
            else if (key == "src_public_cancellation_gap") config.factory.gaps.src_public_cancellation = to_uint32(val_str);
            else if (key == "dst_public_withdrawal_gap") config.factory.gaps.dst_public_withdrawal = to_uint32(val_str);
        }
        else if (current_section == "logging") {
            if (key == "level") {
                auto level = logging::parse_level(val_str);
                if (level) config.log_level = *level;
                else logging::warn("CONFIG", "Unknown log level " + val_str);
            }
        }
    }
    return config;
}

void ChainConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot write config " + path);
    }

    file << "# Crosslock Chain Configuration\n\n";

    file << "[chain]\n";
    file << "name = \"" << name << "\"\n";
    file << "chain_id = " << chain_id << "\n";
    file << "data_dir = \"" << data_dir << "\"\n";
    file << "persistent = " << (persistent ? "true" : "false") << "\n\n";

    file << "[factory]\n";
    file << "owner = \"" << factory.owner.to_hex() << "\"\n";
    file << "order_protocol = \"" << factory.order_protocol.to_hex() << "\"\n";
    file << "access_token = \"" << factory.access_token.to_hex() << "\"\n";
    file << "src_rescue_delay = " << factory.src_rescue_delay << "\n";
    file << "dst_rescue_delay = " << factory.dst_rescue_delay << "\n\n";

    file << "[timelocks]\n";
    file << "src_public_withdrawal_gap = " << factory.gaps.src_public_withdrawal << "\n";
    file << "src_public_cancellation_gap = " << factory.gaps.src_public_cancellation << "\n";
    file << "dst_public_withdrawal_gap = " << factory.gaps.dst_public_withdrawal << "\n\n";

    file << "[logging]\n";
    file << "level = \"" << logging::level_name(log_level) << "\"\n";
}

// ============================================================================
// Chain Implementation
// ============================================================================

Chain::Chain(const ChainConfig& config, std::shared_ptr<Clock> clock)
    : Chain(config, std::move(clock), storage::open_database(config.data_dir, config.persistent)) {}

Chain::Chain(const ChainConfig& config, std::shared_ptr<Clock> clock,
             std::shared_ptr<storage::Database> db)
    : config_(config), clock_(std::move(clock)), db_(std::move(db)) {
    ledger_ = std::make_shared<BalanceLedger>(db_);
    journal_ = std::make_shared<EventJournal>(db_);
    registry_ = std::make_shared<Registry>(db_);

    policy_ = std::make_shared<AnyOfPolicy>(std::vector<std::shared_ptr<AuthorizationPolicy>>{
        std::make_shared<TokenHolderPolicy>(ledger_, config_.factory.access_token),
        std::make_shared<EndorsedSignaturePolicy>(std::make_shared<Ed25519Verifier>(), registry_)
    });

    env_ = std::make_shared<EscrowEnvironment>();
    env_->chain_id = config_.chain_id;
    env_->ledger = ledger_;
    env_->journal = journal_;
    env_->clock = clock_;
    env_->policy = policy_;
    env_->db = db_;

    factory_ = std::make_shared<EscrowFactory>(env_, registry_, config_.factory);
    factory_->load();

    logging::info("CHAIN", config_.name + " ready (chain id " + std::to_string(config_.chain_id) + ")");
}

uint64_t Chain::balance_of(const Address& token, const Address& holder) const {
    return ledger_->balance_of(token, holder);
}

} // namespace crosslock
