#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "health.grpc.pb.h"
#include "health.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;
using proto::health::HealthService;
using proto::health::HealthCheckRequest;
using proto::health::HealthCheckResponse;

class HealthClient {
public:
    explicit HealthClient(std::shared_ptr<Channel> channel)
        : stub_(HealthService::NewStub(channel)) {}

    bool Check(const std::string& source, HealthCheckResponse* response, std::string* error) {
        HealthCheckRequest request;
        request.set_source(source);

        ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));

        Status status = stub_->Check(&context, request, response);
        if (!status.ok()) {
            *error = status.error_message();
            return false;
        }
        return true;
    }

private:
    std::unique_ptr<HealthService::Stub> stub_;
};

int main(int argc, char** argv) {
    std::string server_address("localhost:50051");
    if (argc > 1) {
        server_address = argv[1];
    }

    auto channel = grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials());
    HealthClient client(channel);

    std::cout << "Checking relay server at " << server_address << std::endl;

    HealthCheckResponse response;
    std::string error;
    if (!client.Check("relay-health-client", &response, &error)) {
        std::cout << "RPC failed: " << error << std::endl;
        return 1;
    }

    std::cout << "Status: " << response.status()
              << ", Timestamp: " << response.timestamp()
              << ", Sessions: " << response.active_sessions()
              << " (open " << response.open_sessions() << "/" << response.max_sessions()
              << ", pairing " << response.pending_pairings() << ")"
              << ", Pairing timeout: " << response.pairing_timeout_seconds() << "s" << std::endl;
    return 0;
}
