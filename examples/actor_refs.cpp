#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "common/text/text.hpp"
#include "identity/id_generator.hpp"

DEFINE_int32(actors, 4, "Number of actor references to create");
DEFINE_string(address, "127.0.0.1:7000", "Address the example actors claim to live at");

namespace {

struct ActorRef {
  std::string address;
  ax::Bytes uid;
};

auto make_actor_ref(const std::string &address) -> ax::Expected<ActorRef> {
  auto uid = ax::identity::new_actor_id();
  if (!uid) {
    return tl::unexpected(uid.error());
  }
  return ActorRef{address, std::move(*uid)};
}

}  // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  ax::log::init();

  std::vector<ActorRef> refs;
  for (int i = 0; i < FLAGS_actors; ++i) {
    auto ref = make_actor_ref(FLAGS_address);
    if (!ref) {
      std::cerr << "failed to create actor ref: " << ref.error().message << "\n";
      ax::log::shutdown();
      return 1;
    }
    refs.push_back(std::move(*ref));
  }

  for (const auto &ref : refs) {
    std::cout << ref.address << "/" << ax::text::to_hex(ref.uid) << "\n";
  }
  ax::log::info("actor_refs", {{"count", std::to_string(refs.size())}, {"address", FLAGS_address}});

  ax::log::shutdown();
  return 0;
}
