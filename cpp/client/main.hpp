#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace client {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainBuilder::Validity Stop();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string source_;
};
}  // namespace client
#endif
