#pragma once

#include "curve25519.hh"
#include "entropy.hh"
#include "key_pair.hh"
#include "message_log.hh"
#include "optional.hh"
#include "status.hh"

// Checks whether an X25519 exchange leaks one of its public keys as the shared
// secret.
namespace dhprobe {

enum class Verdict {
  MatchesRemotePublic,
  MatchesLocalPublic,
  Distinct,
};

// Exact byte comparison. Not constant time - all of these values end up in the
// transcript anyway.
Verdict Classify(const curve25519::Shared &shared,
                 const curve25519::Public &local,
                 const curve25519::Public &remote);

// Short line shown on the screen, e.g. "OK: shared != any pubkey".
const char *VerdictStatusLine(Verdict);

struct DiagnosticReport {
  KeyPair local;
  KeyPair remote;
  curve25519::Shared shared;
  Verdict verdict;
};

struct DiagnosticEngine {
  entropy::Source &entropy;
  curve25519::Curve &curve;

  // Performs a single exchange between two fresh key pairs.
  //
  // Progress is appended to `log` and a detailed trace goes to LOG. An aborted
  // run (`status` not Ok) has no report and no verdict.
  Optional<DiagnosticReport> Run(MessageLog &log, Status &);
};

} // namespace dhprobe
