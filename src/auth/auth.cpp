#include "crosslock/auth.hpp"
#include "crosslock/ledger.hpp"
#include "crosslock/logging.hpp"
#include "crosslock/registry.hpp"

namespace crosslock {

// ============================================================================
// Endorsements
// ============================================================================

Hash256 endorsement_digest(uint64_t chain_id, const Address& escrow,
                           PublicAction action, const Hash256& immutables_digest,
                           const Address& caller) {
    static const std::string DOMAIN = "crosslock.endorsement.v2";

    Bytes message(DOMAIN.begin(), DOMAIN.end());
    append_uint64(message, chain_id);
    append_address(message, escrow);
    message.push_back(static_cast<uint8_t>(action));
    message.insert(message.end(), immutables_digest.begin(), immutables_digest.end());
    append_address(message, caller);
    return crypto::Blake2b256::hash(message);
}

Endorsement endorse(uint64_t chain_id, const Address& escrow, PublicAction action,
                    const Hash256& immutables_digest, const Address& caller,
                    const crypto::Ed25519::KeyPair& keypair) {
    auto digest = endorsement_digest(chain_id, escrow, action, immutables_digest, caller);

    Endorsement endorsement;
    endorsement.signer = keypair.public_key;
    endorsement.signature = crypto::Ed25519::sign(digest.data(), digest.size(), keypair.secret_key);
    return endorsement;
}

std::optional<Address> Ed25519Verifier::verify(const Hash256& digest,
                                               const Endorsement& endorsement) const {
    if (!crypto::Ed25519::verify(digest.data(), digest.size(),
                                 endorsement.signature, endorsement.signer)) {
        return std::nullopt;
    }
    return Address::from_public_key(endorsement.signer);
}

// ============================================================================
// Policies
// ============================================================================

TokenHolderPolicy::TokenHolderPolicy(std::shared_ptr<TokenLedger> ledger, Address access_token)
    : ledger_(std::move(ledger)), access_token_(access_token) {}

bool TokenHolderPolicy::authorize(const AuthorizationRequest& request) const {
    return ledger_->balance_of(access_token_, request.context.caller) > 0;
}

EndorsedSignaturePolicy::EndorsedSignaturePolicy(std::shared_ptr<SignatureVerifier> verifier,
                                                 std::shared_ptr<Registry> registry)
    : verifier_(std::move(verifier)), registry_(std::move(registry)) {}

bool EndorsedSignaturePolicy::authorize(const AuthorizationRequest& request) const {
    if (!request.context.endorsement) return false;

    auto digest = endorsement_digest(request.chain_id, request.escrow, request.action,
                                     request.immutables_digest, request.context.caller);
    auto signer = verifier_->verify(digest, *request.context.endorsement);
    if (!signer) {
        logging::debug("AUTH", "Rejected endorsement with bad signature from " +
                       request.context.caller.to_hex());
        return false;
    }
    return registry_->may_resolve(*signer);
}

AnyOfPolicy::AnyOfPolicy(std::vector<std::shared_ptr<AuthorizationPolicy>> policies)
    : policies_(std::move(policies)) {}

bool AnyOfPolicy::authorize(const AuthorizationRequest& request) const {
    for (const auto& policy : policies_) {
        if (policy->authorize(request)) return true;
    }
    return false;
}

} // namespace crosslock
