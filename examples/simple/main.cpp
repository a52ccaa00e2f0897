#include <command_signer.h>
#include <coordinator.h>
#include <curl_http_adapter.h>
#include <vehicle.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "log.cpp"

// Pairing keys are kept next to the binary unless VINFAST_STORAGE_DIR says otherwise
class FileStorageAdapter : public VinFastCloud::StorageAdapter
{
public:
  explicit FileStorageAdapter(std::string directory) : directory_(std::move(directory)) {}

  bool load(const std::string &key, std::vector<uint8_t> &buffer) override
  {
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in)
    {
      return false;
    }
    buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
  }

  bool save(const std::string &key, const std::vector<uint8_t> &buffer) override
  {
    std::ofstream out(path_for(key), std::ios::binary | std::ios::trunc);
    if (!out)
    {
      return false;
    }
    out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return static_cast<bool>(out);
  }

  bool remove(const std::string &key) override { return std::remove(path_for(key).c_str()) == 0; }

private:
  std::string directory_;

  std::string path_for(const std::string &key) const { return directory_ + "/vinfast_" + key + ".json"; }
};

static std::string env_or_empty(const char *name)
{
  const char *value = getenv(name);
  return value ? value : "";
}

int main(int argc, char **argv)
{
  setup_logging();

  VinFastCloud::Credentials credentials;
  credentials.email = env_or_empty("VINFAST_EMAIL");
  credentials.password = env_or_empty("VINFAST_PASSWORD");
  if (credentials.email.empty() || credentials.password.empty())
  {
    printf("Set VINFAST_EMAIL and VINFAST_PASSWORD\n");
    printf("Usage: %s [qr-content]\n", argv[0]);
    return 1;
  }

  VinFastCloud::ClientConfig config;
  VinFastCloud::PollConfig poll_config;
  std::string config_path = env_or_empty("VINFAST_CONFIG");
  if (!config_path.empty())
  {
    std::ifstream in(config_path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    int status = VinFastCloud::load_config_from_json(text, config, poll_config);
    if (status != VinFastCloud::VinFastCloud_Status_E_OK)
    {
      printf("Failed to load config %s: %s\n", config_path.c_str(), VinFastCloud::VinFastCloud_Status_to_string(status));
      return 1;
    }
  }

  std::string storage_dir = env_or_empty("VINFAST_STORAGE_DIR");
  if (storage_dir.empty())
  {
    storage_dir = ".";
  }

  auto http = std::make_shared<VinFastCloud::CurlHttpAdapter>();
  auto storage = std::make_shared<FileStorageAdapter>(storage_dir);
  auto clock = std::make_shared<VinFastCloud::SystemClock>();
  VinFastCloud::Vehicle vehicle(http, storage, clock, config);

  VinFastCloud::DataCoordinator coordinator(vehicle.client(), credentials);
  auto cycle = coordinator.refresh_now();
  if (cycle.is_error())
  {
    printf("Refresh failed: %s\n", cycle.error().to_string().c_str());
    return 1;
  }

  auto data = coordinator.last_data();
  printf("%s\n", data->to_json().dump(2).c_str());
  if (data->telemetry)
  {
    log_telemetry(*data->telemetry);
  }
  printf("VIN: %s, paired: %s\n", vehicle.client().vin().c_str(), vehicle.is_paired() ? "yes" : "no");

  if (argc < 2)
  {
    return 0;
  }

  printf("Starting pairing\n");
  auto started = vehicle.start_pairing(argv[1], "", env_or_empty("VINFAST_PHONE"), credentials.email);
  if (started.is_error())
  {
    printf("Failed to start pairing: %s\n", started.error().to_string().c_str());
    return 1;
  }

  printf("Enter the OTP sent to your phone/email: ");
  fflush(stdout);
  std::string otp;
  if (!std::getline(std::cin, otp) || otp.empty())
  {
    printf("No OTP entered\n");
    return 1;
  }

  auto completed = vehicle.complete_pairing(otp, env_or_empty("VINFAST_PHONE"), credentials.email);
  if (completed.is_error())
  {
    printf("Failed to complete pairing: %s\n", completed.error().to_string().c_str());
    return 1;
  }
  printf("Paired: %s\n", vehicle.is_paired() ? "yes" : "no (no share key returned)");
  return 0;
}
