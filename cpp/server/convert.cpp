#include "server/convert.hpp"

namespace server {

runner::ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader reader) {
  runner::ExecutionRequest request;
  request.source_code = reader.getSourceCode().cStr();
  request.run_foreground = reader.getRunForeground();
  for (capnproto::Asset::Reader asset : reader.getAssets()) {
    capnp::Data::Reader data = asset.getData();
    request.assets.push_back({asset.getName().cStr(),
                              std::string(data.asChars().begin(), data.size())});
  }
  return request;
}

void ToCapnp(const runner::ExecutionRequest& request,
             capnproto::ExecutionRequest::Builder builder) {
  builder.setSourceCode(request.source_code);
  builder.setRunForeground(request.run_foreground);
  auto assets = builder.initAssets(request.assets.size());
  for (size_t i = 0; i < request.assets.size(); i++) {
    const runner::Asset& asset = request.assets[i];
    assets[i].setName(asset.name);
    assets[i].setData(
        kj::arrayPtr(reinterpret_cast<const kj::byte*>(  // NOLINT
                         asset.data.data()),
                     asset.data.size()));
  }
}

runner::ExecutionResult FromCapnp(capnproto::ExecutionResult::Reader reader) {
  runner::ExecutionResult result;
  auto image = reader.getImage();
  if (image.isData()) result.image = std::string(image.getData().cStr());
  result.logs = reader.getLogs().cStr();
  result.error = reader.getError().cStr();
  return result;
}

void ToCapnp(const runner::ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder) {
  KJ_IF_MAYBE(image, result.image) {
    builder.getImage().setData(*image);
  } else {
    builder.getImage().setNone();
  }
  builder.setLogs(result.logs);
  builder.setError(result.error);
}

runner::StopResult FromCapnp(capnproto::StopResult::Reader reader) {
  runner::StopResult result;
  result.stopped = reader.getStopped();
  result.message = reader.getMessage().cStr();
  return result;
}

void ToCapnp(const runner::StopResult& result,
             capnproto::StopResult::Builder builder) {
  builder.setStopped(result.stopped);
  builder.setMessage(result.message);
}

}  // namespace server
