#pragma once

//
// ... Standard header files
//
#include <ostream>
#include <string>

namespace edgekit::data::detail {

  enum class Device_kind { cpu, accelerator };

  /**
   * @brief Location tag carried by every buffer.
   *
   * Buffers on different devices never alias: moving to another device
   * copies the values and retags the copy.
   */
  class Device final {
  public:
    Device() = default;
    Device(Device_kind kind, int ordinal);

    static Device
    cpu();

    static Device
    accelerator(int ordinal = 0);

    Device_kind
    kind() const;

    int
    ordinal() const;

    bool
    is_cpu() const;

    friend bool
    operator==(Device const& device1, Device const& device2);

  private:
    Device_kind kind_{Device_kind::cpu};
    int ordinal_{};

  }; // end of class Device

  std::string
  to_string(Device const& device);

  std::ostream&
  operator<<(std::ostream& os, Device const& device);

} // end of namespace edgekit::data::detail
