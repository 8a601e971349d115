//
//  connection.hpp
//  speech-io
//

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sio {

namespace net {

// One live duplex channel to the speech service. Instances are never
// reused: a dead connection is dropped and a new one is made.
class Connection {
 public:
  virtual ~Connection() = default;

  virtual void send(std::string_view msg) = 0;

  // closing an already dead connection is a no-op
  virtual void close() = 0;

  virtual bool is_alive() const = 0;
};

// Opens connections, performing whatever greeting the service expects.
//
// `on_ready` is invoked exactly once, with nullptr on failure. `on_message`
// receives every inbound frame of the new connection and may be invoked from
// any thread.
class Connector {
 public:
  using message_callback = std::function<void(std::string&& msg)>;
  using ready_callback = std::function<void(std::shared_ptr<Connection>)>;

  virtual ~Connector() = default;

  virtual void async_connect(message_callback on_message, ready_callback on_ready) = 0;
};

} // net

} // sio
