#include "diagnostic.hh"

#include "hex.hh"
#include "log.hh"

namespace dhprobe {

// Bytes per line of the hex dumps sent to the log sink.
static constexpr Size kLogHexWrap = 16;

Verdict Classify(const curve25519::Shared &shared,
                 const curve25519::Public &local,
                 const curve25519::Public &remote) {
  if (shared.bytes == remote.bytes) {
    return Verdict::MatchesRemotePublic;
  }
  if (shared.bytes == local.bytes) {
    return Verdict::MatchesLocalPublic;
  }
  return Verdict::Distinct;
}

const char *VerdictStatusLine(Verdict verdict) {
  switch (verdict) {
  case Verdict::MatchesRemotePublic:
    return "BUG: shared == peer_pub!";
  case Verdict::MatchesLocalPublic:
    return "BUG: shared == our_pub!";
  case Verdict::Distinct:
    return "OK: shared != any pubkey";
  }
  return "";
}

static const char *VerdictDescription(Verdict verdict) {
  switch (verdict) {
  case Verdict::MatchesRemotePublic:
    return "Shared secret equals peer public key!";
  case Verdict::MatchesLocalPublic:
    return "Shared secret equals our public key!";
  case Verdict::Distinct:
    return "ECDH output looks correct";
  }
  return "";
}

Optional<DiagnosticReport> DiagnosticEngine::Run(MessageLog &log, Status &status) {
  DiagnosticReport report = {};
  KeyPairGenerator generator{.entropy = entropy, .curve = curve};

  LOG << "=== STARTING ECDH TEST ===";
  log.Append("=== ECDH TEST ===");

  log.Append("1. Generating our keypair...");
  report.local = generator.Generate(status);
  if (!status.Ok()) {
    status() += "Couldn't generate our keypair";
    return std::nullopt;
  }
  LOG << "Our private key: "
      << BytesToSpacedHex(report.local.secret.bytes, kLogHexWrap);
  LOG << "Our public key: "
      << BytesToSpacedHex(report.local.public_key.bytes, kLogHexWrap);
  log.Append("Our priv: " + BytesToSpacedHex(report.local.secret.bytes));
  log.Append("Our pub:  " + BytesToSpacedHex(report.local.public_key.bytes));

  log.Append("2. Generating peer keypair...");
  report.remote = generator.Generate(status);
  if (!status.Ok()) {
    status() += "Couldn't generate peer keypair";
    return std::nullopt;
  }
  LOG << "Peer private key: "
      << BytesToSpacedHex(report.remote.secret.bytes, kLogHexWrap);
  LOG << "Peer public key: "
      << BytesToSpacedHex(report.remote.public_key.bytes, kLogHexWrap);
  log.Append("Peer pub: " + BytesToSpacedHex(report.remote.public_key.bytes));

  log.Append("3. Computing ECDH...");
  LOG << "Computing ECDH: DH(our_private, peer_public)";
  LOG << "  Input private: "
      << BytesToSpacedHex(report.local.secret.bytes, kLogHexWrap);
  LOG << "  Input public:  "
      << BytesToSpacedHex(report.remote.public_key.bytes, kLogHexWrap);
  report.shared =
      curve.DiffieHellman(report.local.secret, report.remote.public_key);
  LOG << "  Output shared: "
      << BytesToSpacedHex(report.shared.bytes, kLogHexWrap);
  log.Append("Shared:   " + BytesToSpacedHex(report.shared.bytes));

  log.Append("4. Checking results...");
  report.verdict = Classify(report.shared, report.local.public_key,
                            report.remote.public_key);
  log.Append(VerdictStatusLine(report.verdict));
  LOG << VerdictDescription(report.verdict);

  LOG << "=== ECDH TEST COMPLETE ===";
  log.Append("=== TEST COMPLETE ===");
  return report;
}

} // namespace dhprobe
