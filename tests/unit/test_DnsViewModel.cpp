#include <catch2/catch_test_macros.hpp>

#include "viewmodels/DnsViewModel.hpp"

#include "support/Fakes.hpp"

using namespace nettune::core;
using namespace nettune::viewmodels;
using nettune::test::FakeDnsService;
using nettune::test::waitUntil;

namespace {

// Polls until no operation is processing
bool finish(DnsViewModel& vm) {
    return waitUntil([&]() {
        vm.poll();
        return !vm.isProcessing();
    });
}

} // namespace

TEST_CASE("DnsViewModel initial state", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    DnsViewModel vm(service);

    REQUIRE(vm.state() == AppState::idle());
    REQUIRE_FALSE(vm.isProcessing());
    REQUIRE(vm.selectedProvider() == DnsProviderKind::Electro);
    REQUIRE(vm.provider() == DnsProvider::electro());
    REQUIRE_FALSE(vm.status().adapter.has_value());
    REQUIRE(vm.dnsState().kind == DnsState::Kind::None);
    REQUIRE_FALSE(vm.poll());

    REQUIRE_THROWS_AS(DnsViewModel(nullptr), std::invalid_argument);
}

TEST_CASE("DnsViewModel selection", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    DnsViewModel vm(service);

    int selectionChanges = 0;
    QObject::connect(&vm, &DnsViewModel::selectionChanged, [&]() { ++selectionChanges; });

    SECTION("Preset selection") {
        vm.setSelectedProvider(DnsProviderKind::Quad9);
        vm.setSelectedProvider(DnsProviderKind::Quad9);
        REQUIRE(selectionChanges == 1);
        REQUIRE(vm.provider().servers() == std::pair<std::string, std::string>{
                                               "9.9.9.9", "149.112.112.112"});
    }

    SECTION("Custom provider uses the input fields") {
        vm.setSelectedProvider(DnsProviderKind::Custom);
        vm.setCustomServers("1.1.1.1", "1.0.0.1");
        REQUIRE(vm.provider() == DnsProvider::custom("1.1.1.1", "1.0.0.1"));
        REQUIRE(vm.customPrimary() == "1.1.1.1");
        REQUIRE(vm.customSecondary() == "1.0.0.1");
    }
}

TEST_CASE("DnsViewModel status refresh", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    service->setServers({"10.202.10.10", "10.202.10.11"});
    DnsViewModel vm(service);

    int statusChanges = 0;
    QObject::connect(&vm, &DnsViewModel::statusChanged, [&]() { ++statusChanges; });

    vm.refreshStatus();
    REQUIRE(waitUntil([&]() { return vm.poll(); }));

    REQUIRE(statusChanges == 1);
    REQUIRE(vm.status().adapter == "Wi-Fi");
    REQUIRE(vm.dnsState().kind == DnsState::Kind::Static);
    REQUIRE(vm.dnsState().servers ==
            std::vector<std::string>{"10.202.10.10", "10.202.10.11"});
    // Refreshing does not touch the operation state
    REQUIRE(vm.state() == AppState::idle());
}

TEST_CASE("DnsViewModel set operation", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    DnsViewModel vm(service);

    SECTION("Success updates the state and re-reads the status") {
        REQUIRE(vm.requestOperation(DnsOperation::set(DnsProvider::shekan())));
        REQUIRE(vm.isProcessing());
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Success);
        REQUIRE(vm.state().message ==
                "DNS servers 178.22.122.100 and 185.51.200.2 set successfully for 'Wi-Fi'");

        REQUIRE(waitUntil([&]() {
            vm.poll();
            return vm.status().servers.size() == 2;
        }));
        REQUIRE(vm.status().servers ==
                std::vector<std::string>{"178.22.122.100", "185.51.200.2"});
        REQUIRE(service->setCalls() == 1);
    }

    SECTION("Failure is reported as an error") {
        service->setFailSet(true);
        REQUIRE(vm.requestOperation(DnsOperation::set(DnsProvider::electro())));
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Error);
        REQUIRE(vm.state().message == "Error setting primary DNS 78.157.42.100: access denied");
    }

    SECTION("Invalid custom servers are rejected without running anything") {
        REQUIRE_FALSE(vm.requestOperation(DnsOperation::set(DnsProvider::custom("1.1.1.1", ""))));
        REQUIRE(vm.state().kind == AppState::Kind::Error);
        REQUIRE(vm.state().message == "Invalid custom DNS servers");

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE(service->adapterLookups() == 0);
        REQUIRE(service->setCalls() == 0);
    }

    SECTION("Valid custom servers are applied") {
        REQUIRE(vm.requestOperation(DnsOperation::set(DnsProvider::custom("1.1.1.1", "1.0.0.1"))));
        REQUIRE(finish(vm));
        REQUIRE(vm.state().kind == AppState::Kind::Success);
    }
}

TEST_CASE("DnsViewModel rejects overlapping operations", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    service->setOperationDelay(std::chrono::milliseconds(200));
    DnsViewModel vm(service);

    REQUIRE(vm.requestOperation(DnsOperation::set(DnsProvider::radar())));
    REQUIRE_FALSE(vm.requestOperation(DnsOperation::clear()));
    REQUIRE(vm.isProcessing());

    REQUIRE(finish(vm));
    REQUIRE(service->setCalls() == 1);
    REQUIRE(service->clearCalls() == 0);

    // A new request is accepted once the first has finished
    REQUIRE(vm.requestOperation(DnsOperation::clear()));
    REQUIRE(finish(vm));
    REQUIRE(service->clearCalls() == 1);
}

TEST_CASE("DnsViewModel clear and test operations", "[DnsViewModel]") {
    auto service = std::make_shared<FakeDnsService>();
    DnsViewModel vm(service);

    SECTION("Clear") {
        service->setServers({"9.9.9.9"});
        REQUIRE(vm.requestOperation(DnsOperation::clear()));
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Success);
        REQUIRE(vm.state().message == "DNS reset to DHCP successfully for 'Wi-Fi'");
    }

    SECTION("Test with servers configured") {
        service->setServers({"9.9.9.9", "149.112.112.112"});
        REQUIRE(vm.requestOperation(DnsOperation::test()));
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Success);
        REQUIRE(vm.state().message == "DNS test successful: 9.9.9.9, 149.112.112.112");
    }

    SECTION("Test without servers is a warning") {
        REQUIRE(vm.requestOperation(DnsOperation::test()));
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Warning);
        REQUIRE(vm.state().message == "No DNS servers configured");
    }

    SECTION("No adapter") {
        service->setAdapter(std::nullopt);
        REQUIRE(vm.requestOperation(DnsOperation::clear()));
        REQUIRE(finish(vm));

        REQUIRE(vm.state().kind == AppState::Kind::Error);
        REQUIRE(vm.state().message == "No Internet Connection Found");
        REQUIRE(service->clearCalls() == 0);
    }
}
