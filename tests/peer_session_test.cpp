#include <cassert>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "client_peer_manager.h"
#include "client_session.h"
#include "server_connection.h"
#include "test_support.h"

namespace {

std::string last_payload(const MemoryTransport &t, MsgType type) {
  std::string out;
  for (const auto &e : t.written())
    if (e.type == type)
      out = e.fields.back();
  return out;
}

bool has_error_containing(const RecordingObserver &obs,
                          const std::string &needle) {
  for (const auto &e : obs.errors())
    if (e.find(needle) != std::string::npos)
      return true;
  return false;
}

// Session against a scripted relay.
void test_scripted_relay() {
  const KeyPair bob_kp = generate_keypair();
  const KeyPair carol_kp = generate_keypair();

  RecordingObserver obs;
  auto owned = std::make_unique<MemoryTransport>();
  MemoryTransport &relay = *owned;
  relay.feed(build_auth_success());
  relay.feed(build_user_list({"alice", "bob"}));
  relay.feed(build_key_exchange("bob", bob_kp.public_pem));

  PeerSession alice("alice", obs);
  assert(alice.send("bob", "too early") == SendResult::NotActive);
  assert(alice.connect(std::move(owned)).empty());
  assert(alice.state() == SessionState::Active);
  assert(obs.states().size() == 1 && obs.states()[0].first);
  assert(alice.fingerprint().size() == 2 * SHA256_LEN);

  assert(wait_until([&] {
    return alice.known_peers() == std::vector<std::string>{"bob"} &&
           obs.directory() == (std::vector<std::string>{"alice", "bob"});
  }));
  assert(alice.peer("bob")->peer_fp_hex == fingerprint_hex(bob_kp.public_pem));

  // The first envelope on the wire is the authentication request.
  const auto first = relay.written().front();
  assert(first.type == MsgType::Auth && first.field(0) == "alice");
  const PublicKey alice_pub = std::get<PublicKey>(import_public(first.field(1)));
  assert(fingerprint_hex(alice_pub.pem) == alice.fingerprint());

  // Outbound unicast carries no plaintext and opens only for the recipient.
  assert(alice.send("bob", "attack at dawn") == SendResult::Sent);
  const std::string payload = last_payload(relay, MsgType::Message);
  assert(!payload.empty());
  assert(payload.find("attack at dawn") == std::string::npos);
  {
    auto msgs = relay.written();
    assert(msgs.back().type == MsgType::Message);
    assert(msgs.back().field(0) == "bob");
  }

  PeerManager bob_pm("bob");
  assert(bob_pm.update_peer_key("alice", alice_pub) == KeyUpdate::Added);
  auto opened = bob_pm.open(MsgType::Message, "alice", payload, bob_kp);
  assert(std::get<std::string>(opened) == "attack at dawn");

  // Same secret on later messages; still decrypts.
  assert(alice.send("bob", "second") == SendResult::Sent);
  auto opened2 = bob_pm.open(MsgType::Message, "alice",
                             last_payload(relay, MsgType::Message), bob_kp);
  assert(std::get<std::string>(opened2) == "second");

  // A unicast payload replayed as a broadcast fails the signature.
  auto as_broadcast = bob_pm.open(MsgType::Broadcast, "alice", payload, bob_kp);
  assert(std::get<CryptoError>(as_broadcast) == CryptoError::SignatureInvalid);

  // Any change to the signed portion is caught.
  std::string tampered = payload;
  const size_t cipher_at = tampered.find('.') + 1;
  tampered[cipher_at] = tampered[cipher_at] == 'A' ? 'B' : 'A';
  auto bad = bob_pm.open(MsgType::Message, "alice", tampered, bob_kp);
  assert(std::get<CryptoError>(bad) == CryptoError::SignatureInvalid);

  // A third party holds no grant.
  PeerManager carol_pm("carol");
  assert(carol_pm.update_peer_key("alice", alice_pub) == KeyUpdate::Added);
  auto stolen = carol_pm.open(MsgType::Message, "alice", payload, carol_kp);
  assert(std::get<CryptoError>(stolen) == CryptoError::NoKeyForPeer);

  // Inbound unicast and broadcast from bob.
  relay.feed(build_message(
      "bob", std::get<std::string>(bob_pm.seal_for("alice", "roger", bob_kp))));
  relay.feed(build_broadcast_from("bob",
                                  bob_pm.seal_broadcast("to everyone", bob_kp)));
  assert(wait_until([&] { return obs.messages().size() == 2; }));
  assert(obs.messages()[0].sender == "bob" && obs.messages()[0].text == "roger");
  assert(obs.messages()[1].text == "to everyone");

  // Undecryptable input is reported and the session keeps going.
  relay.feed(build_message("bob", "garbage"));
  relay.feed(build_message("mallory", std::get<std::string>(bob_pm.seal_for(
                                          "alice", "spoof", bob_kp))));
  assert(wait_until([&] {
    return has_error_containing(obs, "Could not decrypt message from bob") &&
           has_error_containing(obs, "Could not decrypt message from mallory");
  }));
  assert(alice.state() == SessionState::Active);
  assert(obs.messages().size() == 2);

  // Recipient checks.
  assert(alice.send("alice", "me") == SendResult::InvalidRecipient);
  assert(alice.send("no way", "x") == SendResult::InvalidRecipient);
  assert(alice.send("dave", "x") == SendResult::NoKeyForPeer);
  assert(alice.send("ALL", "hello all") == SendResult::Sent);
  auto bcast = bob_pm.open(MsgType::Broadcast, "alice",
                           last_payload(relay, MsgType::Broadcast), bob_kp);
  assert(std::get<std::string>(bcast) == "hello all");

  // A weak key from the relay is refused; broadcasts still go out.
  relay.feed(build_key_exchange("mallory", generate_keypair(1024).public_pem));
  assert(wait_until([&] {
    return has_error_containing(obs, "Invalid public key received for mallory");
  }));
  assert(alice.known_peers() == std::vector<std::string>{"bob"});
  assert(alice.send("ALL", "still here") == SendResult::Sent);
  auto bcast2 = bob_pm.open(MsgType::Broadcast, "alice",
                            last_payload(relay, MsgType::Broadcast), bob_kp);
  assert(std::get<std::string>(bcast2) == "still here");

  // Departure drops the key.
  relay.feed(build_user_list({"alice"}));
  assert(wait_until([&] { return alice.known_peers().empty(); }));
  assert(alice.send("bob", "gone?") == SendResult::NoKeyForPeer);

  // Relay-initiated shutdown.
  relay.feed(build_disconnect("Server shutting down"));
  assert(wait_until([&] { return alice.state() == SessionState::Closed; }));
  assert(wait_until([&] { return obs.states().size() == 2; }));
  assert(!obs.states()[1].first);
  assert(obs.states()[1].second == "Disconnected by relay: Server shutting down");
  assert(alice.send("ALL", "late") == SendResult::NotActive);

  alice.disconnect();
  assert(obs.states().size() == 2);
}

// A peer key too small to wrap the secret costs that peer its grant only.
void test_unwrappable_peer_key() {
  const KeyPair alice_kp = generate_keypair();
  const KeyPair bob_kp = generate_keypair();
  const KeyPair tiny = generate_keypair(512);

  PeerManager pm("alice");
  assert(pm.update_peer_key("bob", public_of(bob_kp)) == KeyUpdate::Added);
  assert(pm.update_peer_key("mallory", public_of(tiny)) == KeyUpdate::Added);

  const std::string payload = pm.seal_broadcast("hi all", alice_kp);
  PeerManager bob_pm("bob");
  assert(bob_pm.update_peer_key("alice", public_of(alice_kp)) ==
         KeyUpdate::Added);
  auto opened = bob_pm.open(MsgType::Broadcast, "alice", payload, bob_kp);
  assert(std::get<std::string>(opened) == "hi all");

  assert(std::get<CryptoError>(pm.seal_for("mallory", "psst", alice_kp)) ==
         CryptoError::NoKeyForPeer);
  auto to_bob = pm.seal_for("bob", "psst", alice_kp);
  auto opened2 =
      bob_pm.open(MsgType::Message, "alice", std::get<std::string>(to_bob),
                  bob_kp);
  assert(std::get<std::string>(opened2) == "psst");
}

void test_rejected_connect() {
  RecordingObserver obs;
  auto t = std::make_unique<MemoryTransport>();
  t->feed(build_auth_rejected("Username 'alice' already taken"));

  PeerSession s("alice", obs);
  assert(s.connect(std::move(t)) == "Username 'alice' already taken");
  assert(s.state() == SessionState::Closed);
  assert(obs.states().empty());
  assert(s.connect(std::make_unique<MemoryTransport>()) ==
         "session already used");

  PeerSession bad("x", obs);
  assert(bad.connect(std::make_unique<MemoryTransport>()) == "Invalid username");
}

// Three sessions through a live relay on loopback.
void test_live_relay() {
  RecordingAuditSink audit;
  RelayConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  RelayServer server(cfg, audit);
  server.start();
  const int port = server.port();
  assert(port > 0);

  RecordingObserver a_obs, b_obs, c_obs, dup_obs;
  PeerSession alice("alice", a_obs);
  PeerSession bob("bob", b_obs);
  PeerSession carol("carol", c_obs);
  assert(alice.connect("127.0.0.1", port).empty());
  assert(bob.connect("127.0.0.1", port).empty());
  assert(carol.connect("127.0.0.1", port).empty());

  assert(wait_until([&] {
    return alice.known_peers().size() == 2 && bob.known_peers().size() == 2 &&
           carol.known_peers().size() == 2;
  }));
  assert(wait_until([&] {
    return a_obs.directory() ==
           (std::vector<std::string>{"alice", "bob", "carol"});
  }));

  assert(alice.send("bob", "hello bob") == SendResult::Sent);
  assert(alice.send("ALL", "hello all") == SendResult::Sent);
  assert(wait_until([&] {
    return b_obs.messages().size() == 2 && c_obs.messages().size() == 1;
  }));
  assert(b_obs.messages()[0].sender == "alice");
  assert(b_obs.messages()[0].text == "hello bob");
  assert(b_obs.messages()[1].text == "hello all");
  assert(c_obs.messages()[0].text == "hello all");
  assert(a_obs.messages().empty());
  assert(wait_until([&] { return audit.count("message_routed") == 2; }));

  // A second session cannot take a live name.
  PeerSession dup("bob", dup_obs);
  assert(dup.connect("127.0.0.1", port) == "Username 'bob' already taken");
  assert(server.directory().size() == 3);

  bob.disconnect();
  assert(bob.state() == SessionState::Closed);
  assert(b_obs.states().back().second == "Disconnected");
  assert(wait_until([&] {
    return a_obs.directory() == (std::vector<std::string>{"alice", "carol"}) &&
           alice.known_peers() == std::vector<std::string>{"carol"};
  }));
  assert(alice.send("bob", "still there?") == SendResult::NoKeyForPeer);

  server.stop();
  assert(wait_until([&] {
    return alice.state() == SessionState::Closed &&
           carol.state() == SessionState::Closed;
  }));
  assert(a_obs.states().back().second ==
         "Disconnected by relay: Server shutting down");

  // Unreachable relay.
  RecordingObserver late_obs;
  PeerSession late("dave", late_obs);
  assert(late.connect("127.0.0.1", port).rfind("Connection failed", 0) == 0);
  assert(late_obs.states().empty());
}

} // namespace

int main() {
  crypto_init();
  test_scripted_relay();
  test_unwrappable_peer_key();
  test_rejected_connect();
  test_live_relay();
  return 0;
}
