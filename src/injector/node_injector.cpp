/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "blockchain/anchor_verifier.hpp"
#include "blockchain/fork_choice_table.hpp"
#include "blockchain/impl/block_proven_journal.hpp"
#include "blockchain/impl/in_memory_protocol_state.hpp"
#include "blockchain/proving_engine.hpp"
#include "blockchain/submission_validator.hpp"
#include "clock/impl/system_clock_impl.hpp"
#include "codec/impl/rlp_transaction_codec.hpp"
#include "crypto/impl/golden_touch_signer.hpp"
#include "log/logger.hpp"
#include "resolver/impl/address_manager.hpp"
#include "types/protocol_config.hpp"
#include "verifier/impl/proof_verifier_fake.hpp"

namespace {
  namespace di = boost::di;
  using namespace taiko;  // NOLINT

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SystemClock>.to<clock::SystemClockImpl>(),
        di::bind<ProtocolConfig>.to([](const auto &injector) {
          return injector
              .template create<app::Configuration const &>()
              .protocol();
        }),
        di::bind<blockchain::ProtocolState, blockchain::InMemoryProtocolState>.to<blockchain::InMemoryProtocolState>(),
        di::bind<blockchain::BlockProvenObserver, blockchain::BlockProvenJournal>.to<blockchain::BlockProvenJournal>(),
        di::bind<resolver::AddressResolver>.to<resolver::AddressManager>(),
        di::bind<verifier::ProofVerifier>.to<verifier::ProofVerifierFake>(),
        di::bind<codec::TransactionCodec>.to<codec::RlpTransactionCodec>(),
        di::bind<crypto::AnchorSigner>.to<crypto::GoldenTouchSigner>(),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace taiko::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }
}  // namespace taiko::injector
