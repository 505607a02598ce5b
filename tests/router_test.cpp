#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "server_handlers.h"
#include "shared_common_crypto.h"
#include "test_support.h"

namespace {

struct Conn {
  std::shared_ptr<MemoryTransport> transport;
  std::shared_ptr<ClientState> client;
  std::thread thread;

  void join() {
    if (thread.joinable())
      thread.join();
  }
};

std::unique_ptr<Conn> open_conn(RelayRouter &router) {
  auto c = std::make_unique<Conn>();
  c->transport = std::make_shared<MemoryTransport>();
  c->client = std::make_shared<ClientState>(c->transport);
  auto client = c->client;
  c->thread = std::thread([&router, client] { router.serve(client); });
  return c;
}

size_t count_type(const MemoryTransport &t, MsgType type) {
  size_t n = 0;
  for (const auto &e : t.written())
    if (e.type == type)
      ++n;
  return n;
}

std::vector<Envelope> of_type(const MemoryTransport &t, MsgType type) {
  std::vector<Envelope> out;
  for (auto &e : t.written())
    if (e.type == type)
      out.push_back(e);
  return out;
}

std::vector<std::string> last_user_list(const MemoryTransport &t) {
  auto lists = of_type(t, MsgType::UserList);
  if (lists.empty())
    return {};
  return parse_user_list(lists.back().field(0));
}

// Authenticates and waits for the acknowledgment.
std::unique_ptr<Conn> login(RelayRouter &router, const std::string &name,
                            const KeyPair &kp) {
  auto c = open_conn(router);
  c->transport->feed(build_auth(name, kp.public_pem));
  const bool acked = wait_until([&] {
    auto auth = of_type(*c->transport, MsgType::Auth);
    return !auth.empty();
  });
  assert(acked);
  auto auth = of_type(*c->transport, MsgType::Auth);
  assert(auth.front().field(0) == "SUCCESS");
  return c;
}

std::string rejection_of(RelayRouter &router, const std::string &bytes) {
  auto c = open_conn(router);
  c->transport->feed(bytes);
  c->join();
  assert(c->transport->was_shutdown());
  auto auth = of_type(*c->transport, MsgType::Auth);
  assert(auth.size() == 1);
  assert(auth[0].field(0) == "REJECTED");
  return auth[0].field(1);
}

} // namespace

int main() {
  crypto_init();
  const KeyPair alice_kp = generate_keypair();
  const KeyPair bob_kp = generate_keypair();
  const KeyPair carol_kp = generate_keypair();
  const KeyPair weak_kp = generate_keypair(1024);

  SessionDirectory dir;
  RecordingAuditSink audit;
  RelayRouter router(dir, audit);

  // First session: ack and a one-entry directory, no keys.
  auto alice = login(router, "alice", alice_kp);
  assert(wait_until([&] {
    return last_user_list(*alice->transport) ==
           std::vector<std::string>{"alice"};
  }));
  assert(count_type(*alice->transport, MsgType::KeyExchange) == 0);

  // Second session gets exactly one key (alice's); alice gets bob's only.
  auto bob = login(router, "bob", bob_kp);
  assert(wait_until([&] {
    return count_type(*alice->transport, MsgType::KeyExchange) == 1 &&
           count_type(*bob->transport, MsgType::KeyExchange) == 1;
  }));
  {
    auto to_bob = of_type(*bob->transport, MsgType::KeyExchange);
    assert(to_bob[0].field(0) == "alice");
    assert(to_bob[0].field(1) == alice_kp.public_pem);
    auto to_alice = of_type(*alice->transport, MsgType::KeyExchange);
    assert(to_alice[0].field(0) == "bob");
    assert(last_user_list(*alice->transport) ==
           (std::vector<std::string>{"alice", "bob"}));
    // Acknowledgment precedes everything else.
    assert(bob->transport->written().front().type == MsgType::Auth);
  }
  assert(wait_until([&] {
    return audit.count("auth_success") == 2 && audit.count("key_exchange") == 1;
  }));

  auto carol = login(router, "carol", carol_kp);
  assert(wait_until([&] {
    return count_type(*carol->transport, MsgType::KeyExchange) == 2 &&
           count_type(*alice->transport, MsgType::KeyExchange) == 2 &&
           count_type(*bob->transport, MsgType::KeyExchange) == 2;
  }));

  // Broadcast reaches everyone except the sender, stamped with the sender.
  alice->transport->feed(build_broadcast("opaque-broadcast"));
  assert(wait_until([&] {
    return count_type(*bob->transport, MsgType::Broadcast) == 1 &&
           count_type(*carol->transport, MsgType::Broadcast) == 1;
  }));
  {
    auto b = of_type(*bob->transport, MsgType::Broadcast);
    assert(b[0].field(0) == "alice");
    assert(b[0].field(1) == "opaque-broadcast");
  }
  assert(count_type(*alice->transport, MsgType::Broadcast) == 0);
  {
    bool routed_to_all = false;
    for (const auto &e : audit.events())
      if (e.kind == "message_routed" && e.a == "alice" && e.b == "ALL")
        routed_to_all = true;
    assert(routed_to_all);
  }

  // Unicast goes to the recipient only.
  alice->transport->feed(build_message("bob", "opaque||unicast"));
  assert(wait_until(
      [&] { return count_type(*bob->transport, MsgType::Message) == 1; }));
  {
    auto m = of_type(*bob->transport, MsgType::Message);
    assert(m[0].field(0) == "alice");
    assert(m[0].field(1) == "opaque||unicast");
  }
  assert(count_type(*carol->transport, MsgType::Message) == 0);

  // Unicast to an unknown identity is dropped silently; the relay goes on.
  const size_t alice_before = alice->transport->written().size();
  alice->transport->feed(build_message("dave", "lost"));
  alice->transport->feed(build_message("carol", "found"));
  assert(wait_until(
      [&] { return count_type(*carol->transport, MsgType::Message) == 1; }));
  assert(alice->transport->written().size() == alice_before);

  // Duplicate identity is rejected; the original stays registered.
  const std::string dup =
      rejection_of(router, frame_envelope(build_auth("bob", carol_kp.public_pem)));
  assert(dup == "Username 'bob' already taken");
  assert(dir.find("bob")->handle == bob->client);

  // Malformed authentication attempts.
  assert(rejection_of(router, "AUTH||mallory" + std::string(MSG_DELIMITER)) ==
         "Invalid authentication format");
  assert(rejection_of(router, frame_envelope(build_broadcast("hi"))) ==
         "Invalid authentication format");
  assert(rejection_of(router, "HELLO||x" + std::string(MSG_DELIMITER)) ==
         "Unknown message type");
  assert(rejection_of(router, frame_envelope(build_auth("x!", alice_kp.public_pem))) ==
         "Invalid username");
  assert(rejection_of(router, frame_envelope(build_auth("mallory", "not a key"))) ==
         "Invalid public key");
  assert(rejection_of(router, frame_envelope(build_auth(
                                  "mallory", weak_kp.public_pem))) ==
         "Invalid public key");
  assert(!dir.find("mallory").has_value());
  assert(audit.count("auth_failure") == 7);
  assert(dir.size() == 3);

  // Protocol errors after authentication are dropped and flagged.
  const size_t suspicious_before = audit.count("suspicious");
  alice->transport->feed(build_auth("alice", alice_kp.public_pem));
  alice->transport->feed("NOPE||x" + std::string(MSG_DELIMITER));
  alice->transport->feed(build_key_exchange("alice", "pem"));
  assert(wait_until(
      [&] { return audit.count("suspicious") == suspicious_before + 3; }));
  assert(dir.size() == 3);

  // A failing target is removed during fan-out; delivery continues.
  carol->transport->fail_writes(true);
  bob->transport->feed(build_broadcast("after-failure"));
  assert(wait_until([&] {
    return count_type(*alice->transport, MsgType::Broadcast) == 1 &&
           !dir.find("carol").has_value();
  }));
  assert(wait_until([&] {
    return last_user_list(*alice->transport) ==
               (std::vector<std::string>{"alice", "bob"}) &&
           last_user_list(*bob->transport) ==
               (std::vector<std::string>{"alice", "bob"});
  }));
  carol->join();

  // Explicit disconnect removes the session and updates the others.
  bob->transport->feed(build_disconnect());
  bob->join();
  assert(!dir.find("bob").has_value());
  assert(wait_until([&] {
    return last_user_list(*alice->transport) ==
           std::vector<std::string>{"alice"};
  }));

  // The name is free again.
  auto bob2 = login(router, "bob", bob_kp);
  assert(dir.find("bob")->handle == bob2->client);

  // End of stream behaves like a disconnect.
  bob2->transport->finish();
  bob2->join();
  alice->transport->finish();
  alice->join();
  assert(dir.size() == 0);

  // Oversized partial envelope closes the connection.
  {
    SessionDirectory small_dir;
    RecordingAuditSink small_audit;
    RelayRouter small(small_dir, small_audit, RouterOptions{256, 1024});
    auto c = login(small, "alice", alice_kp);
    c->transport->feed(std::string(4096, 'x'));
    c->join();
    assert(small_dir.size() == 0);
    assert(small_audit.count("suspicious") == 1);
  }

  // Registration whose acknowledgment cannot be delivered is not a success.
  {
    SessionDirectory d3;
    RecordingAuditSink a3;
    RelayRouter r3(d3, a3);
    auto bystander = login(r3, "bob", bob_kp);
    auto c = open_conn(r3);
    c->transport->fail_writes(true);
    c->transport->feed(build_auth("alice", alice_kp.public_pem));
    c->join();
    assert(c->transport->was_shutdown());
    assert(!d3.find("alice").has_value());
    assert(d3.size() == 1);
    assert(wait_until([&] { return a3.count("auth_success") == 1; }));
    for (const auto &e : a3.events())
      assert(!(e.kind == "auth_success" && e.a == "alice"));
    bystander->transport->finish();
    bystander->join();
  }

  // Broadcast recipients are formatted by the log sink.
  {
    std::ostringstream os;
    LogAuditSink sink(os);
    sink.message_routed("alice", BROADCAST_TARGET);
    sink.message_routed("alice", "bob");
    const std::string text = os.str();
    assert(text.find("MESSAGE_SENT | From: alice | To: ALL (broadcast)\n") !=
           std::string::npos);
    assert(text.find("MESSAGE_SENT | From: alice | To: bob\n") !=
           std::string::npos);
  }

  // Relay shutdown notice.
  {
    SessionDirectory d2;
    RecordingAuditSink a2;
    RelayRouter r2(d2, a2);
    auto c = login(r2, "alice", alice_kp);
    r2.disconnect_all("Server shutting down");
    c->join();
    auto bye = of_type(*c->transport, MsgType::Disconnect);
    assert(bye.size() == 1 && bye[0].field(0) == "Server shutting down");
    assert(d2.size() == 0);
  }

  return 0;
}
