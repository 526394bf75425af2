#pragma once
/** @file  FakeSpaBackend.hpp
 *  @brief Scriptable ISpaBackend: canned discovery results and handshake event scripts.
 */

#include "spa/ISpaBackend.hpp"
#include "transport/coro/coroIoContext.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace spaman::test {

  class FakeSpaBackend;

  class FakeLocator : public spa::ISpaLocator {
  public:
    FakeLocator(FakeSpaBackend& backend, std::optional<std::string> address, std::optional<std::string> identifier)
        : backend_(backend), address_(std::move(address)), identifier_(std::move(identifier)) {}

    Task<void> discover() override;
    const std::vector<spa::SpaDescriptor>& spas() const override { return spas_; }

  private:
    FakeSpaBackend& backend_;
    std::optional<std::string> address_;
    std::optional<std::string> identifier_;
    std::vector<spa::SpaDescriptor> spas_;
  };

  class FakeSpa : public spa::ISpa {
  public:
    FakeSpa(FakeSpaBackend& backend, spa::SpaDescriptor descriptor, spa::SpaEventCallback on_event)
        : backend_(backend), descriptor_(std::move(descriptor)), on_event_(std::move(on_event)) {}
    ~FakeSpa() override;

    Task<void> connect() override;
    Task<void> disconnect() override;
    const spa::SpaDescriptor& descriptor() const override { return descriptor_; }

  private:
    FakeSpaBackend& backend_;
    spa::SpaDescriptor descriptor_;
    spa::SpaEventCallback on_event_;
    bool connecting_ = false;
  };

  class FakeFacade : public spa::ISpaFacade {
  public:
    explicit FakeFacade(spa::SpaDescriptor descriptor) : descriptor_(std::move(descriptor)) {}
    const spa::SpaDescriptor& descriptor() const override { return descriptor_; }
    std::string name() const override { return descriptor_.name; }

  private:
    spa::SpaDescriptor descriptor_;
  };

  class FakeSpaBackend : public spa::ISpaBackend {
  public:
    // --- Script ---
    std::vector<spa::SpaDescriptor> descriptors;
    /// Drop descriptors whose identifier differs from the identifier hint.
    bool filter_by_identifier = true;
    std::optional<std::string> discovery_error;
    std::chrono::milliseconds discovery_delay{ 0 };
    /// Events a session reports from connect(), in order.
    std::vector<spa::SpaEvent> handshake_events{ spa::SpaEvent::CONNECTION_GOT_CHANNEL,
                                                 spa::SpaEvent::CONNECTION_SPA_COMPLETE };
    std::optional<std::string> connect_error;
    /// Time connect() spends before reporting the first handshake event.
    std::chrono::milliseconds connect_delay{ 0 };

    // --- Observations ---
    size_t locators_created = 0;
    size_t discover_calls = 0;
    size_t connect_calls = 0;
    size_t disconnect_calls = 0;
    size_t sessions_destroyed = 0;
    /// Sessions destroyed while their own connect() was still running.
    size_t sessions_destroyed_while_connecting = 0;
    std::optional<std::string> last_address_hint;
    std::optional<std::string> last_identifier_hint;
    std::optional<spa::SpaDescriptor> last_connected;
    spa::ClientId last_client_id;
    /// Callback handed to the most recent collaborator; lets tests inject events.
    spa::SpaEventCallback last_callback;

    std::unique_ptr<spa::ISpaLocator> create_locator(transport::TaskSupervisor&, spa::SpaEventCallback on_event,
                                                     std::optional<std::string> spa_address,
                                                     std::optional<std::string> spa_identifier) override {
      locators_created++;
      last_callback = on_event;
      last_address_hint = spa_address;
      last_identifier_hint = spa_identifier;
      return std::make_unique<FakeLocator>(*this, std::move(spa_address), std::move(spa_identifier));
    }

    std::unique_ptr<spa::ISpa> create_spa(const spa::ClientId& client_id, const spa::SpaDescriptor& descriptor,
                                          transport::TaskSupervisor&, spa::SpaEventCallback on_event) override {
      last_callback = on_event;
      last_client_id = client_id;
      last_connected = descriptor;
      return std::make_unique<FakeSpa>(*this, descriptor, std::move(on_event));
    }

    std::unique_ptr<spa::ISpaFacade> create_facade(spa::ISpa& spa) override {
      return std::make_unique<FakeFacade>(spa.descriptor());
    }
  };

  inline Task<void> FakeLocator::discover() {
    backend_.discover_calls++;
    if (backend_.discovery_delay.count() > 0) {
      co_await transport::sleep_for(backend_.discovery_delay);
    }
    if (backend_.discovery_error) {
      throw std::runtime_error(*backend_.discovery_error);
    }
    for (const auto& d : backend_.descriptors) {
      if (backend_.filter_by_identifier && identifier_ && d.identifier != *identifier_) continue;
      spas_.push_back(d);
    }
  }

  inline FakeSpa::~FakeSpa() {
    backend_.sessions_destroyed++;
    if (connecting_) {
      backend_.sessions_destroyed_while_connecting++;
    }
  }

  inline Task<void> FakeSpa::connect() {
    backend_.connect_calls++;
    connecting_ = true;
    if (backend_.connect_delay.count() > 0) {
      co_await transport::sleep_for(backend_.connect_delay);
    }
    spa::SpaEventPayload payload;
    payload.descriptor = descriptor_;
    for (auto event : backend_.handshake_events) {
      co_await on_event_(event, payload);
    }
    connecting_ = false;
    if (backend_.connect_error) {
      throw std::runtime_error(*backend_.connect_error);
    }
  }

  inline Task<void> FakeSpa::disconnect() {
    backend_.disconnect_calls++;
    co_return;
  }

} // namespace spaman::test
