#include "client/main.hpp"
#include "runner/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class KataRunnerMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit KataRunnerMain(kj::ProcessContext& context)
      : context(context), sm(&context), rm(&context), cm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, util::version,
                           "Runs the image scripts written by learners")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the server")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a script locally")
        .addSubCommand("client", KJ_BIND_METHOD(cm, getMain),
                       "send a script to a server")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  runner::Main rm;
  client::Main cm;
};

KJ_MAIN(KataRunnerMain);
