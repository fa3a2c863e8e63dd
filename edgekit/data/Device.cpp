#include <edgekit/data/Device.hpp>

//
// ... Standard header files
//
#include <stdexcept>

namespace edgekit::data::detail {

  Device::Device(Device_kind kind, int ordinal)
    : kind_(kind)
    , ordinal_(ordinal)
  {
    if (ordinal_ < 0) {
      throw std::invalid_argument("invalid device ordinal");
    }
  }

  Device
  Device::cpu()
  {
    return Device{};
  }

  Device
  Device::accelerator(int ordinal)
  {
    return Device{Device_kind::accelerator, ordinal};
  }

  Device_kind
  Device::kind() const { return kind_; }

  int
  Device::ordinal() const { return ordinal_; }

  bool
  Device::is_cpu() const { return kind_ == Device_kind::cpu; }

  bool
  operator==(Device const& device1, Device const& device2)
  {
    return device1.kind_ == device2.kind_ && device1.ordinal_ == device2.ordinal_;
  }

  std::string
  to_string(Device const& device)
  {
    if (device.is_cpu()) { return "cpu"; }
    return "accelerator:" + std::to_string(device.ordinal());
  }

  std::ostream&
  operator<<(std::ostream& os, Device const& device)
  {
    return os << to_string(device);
  }

} // end of namespace edgekit::data::detail
