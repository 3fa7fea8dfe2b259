#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "crosslock/types.hpp"
#include "crosslock/crypto.hpp"

namespace crosslock {

class TokenLedger;
class Registry;

/**
 * @brief Off-chain approval of a public escrow action by a resolver
 */
struct Endorsement {
    crypto::Ed25519::PublicKey signer{};
    crypto::Ed25519::Signature signature{};
};

/**
 * @brief Identity of the party submitting an operation
 */
struct CallContext {
    Address caller;
    std::optional<Endorsement> endorsement;

    static CallContext from(const Address& caller) { return CallContext{caller, std::nullopt}; }
};

enum class PublicAction : uint8_t {
    Withdraw = 1,
    Cancel = 2
};

/**
 * @brief Message a resolver signs to endorse a public action
 *
 * Binds the chain, the escrow, the action and the escrow's Immutables
 * digest, so an endorsement cannot be replayed against another swap. It
 * also names the caller allowed to present it, who collects the deposit.
 */
Hash256 endorsement_digest(uint64_t chain_id, const Address& escrow,
                           PublicAction action, const Hash256& immutables_digest,
                           const Address& caller);

Endorsement endorse(uint64_t chain_id, const Address& escrow, PublicAction action,
                    const Hash256& immutables_digest, const Address& caller,
                    const crypto::Ed25519::KeyPair& keypair);

/**
 * @brief Signature primitive: verify(digest, signature) -> signer
 */
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;
    virtual std::optional<Address> verify(const Hash256& digest,
                                          const Endorsement& endorsement) const = 0;
};

class Ed25519Verifier : public SignatureVerifier {
public:
    std::optional<Address> verify(const Hash256& digest,
                                  const Endorsement& endorsement) const override;
};

/**
 * @brief Everything a policy may inspect when a public action is attempted
 */
struct AuthorizationRequest {
    const CallContext& context;
    uint64_t chain_id;
    Address escrow;
    PublicAction action;
    Hash256 immutables_digest;
};

/**
 * @brief Capability check for the public escrow windows
 */
class AuthorizationPolicy {
public:
    virtual ~AuthorizationPolicy() = default;
    virtual bool authorize(const AuthorizationRequest& request) const = 0;
    virtual const char* name() const = 0;
};

// Caller holds a positive balance of the access token
class TokenHolderPolicy : public AuthorizationPolicy {
public:
    TokenHolderPolicy(std::shared_ptr<TokenLedger> ledger, Address access_token);

    bool authorize(const AuthorizationRequest& request) const override;
    const char* name() const override { return "token-holder"; }

    const Address& access_token() const { return access_token_; }

private:
    std::shared_ptr<TokenLedger> ledger_;
    Address access_token_;
};

// Caller presents an endorsement from a whitelisted resolver
// (any valid signer while the whitelist is bypassed)
class EndorsedSignaturePolicy : public AuthorizationPolicy {
public:
    EndorsedSignaturePolicy(std::shared_ptr<SignatureVerifier> verifier,
                            std::shared_ptr<Registry> registry);

    bool authorize(const AuthorizationRequest& request) const override;
    const char* name() const override { return "endorsed-signature"; }

private:
    std::shared_ptr<SignatureVerifier> verifier_;
    std::shared_ptr<Registry> registry_;
};

class AnyOfPolicy : public AuthorizationPolicy {
public:
    explicit AnyOfPolicy(std::vector<std::shared_ptr<AuthorizationPolicy>> policies);

    bool authorize(const AuthorizationRequest& request) const override;
    const char* name() const override { return "any-of"; }

private:
    std::vector<std::shared_ptr<AuthorizationPolicy>> policies_;
};

} // namespace crosslock
