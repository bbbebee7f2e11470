// File Overview: Declares the knob's attribute table: every service,
// characteristic and descriptor with its handle, capabilities and current value.
// The NimBLE adapter registers from it; the session code only talks handles.
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "ble/BleTypes.hpp"

struct GattUuid {
  uint8_t len = 0;        // 2 or 16
  uint8_t bytes[16] = {}; // little-endian, as sent on air

  static GattUuid from16(uint16_t uuid16);
  // Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
  static bool parse128(const char* text, GattUuid& out);

  bool is16() const { return len == 2; }
  uint16_t as16() const { return (uint16_t)(bytes[0] | (bytes[1] << 8)); }
};

enum GattCap : uint8_t {
  kCapRead       = 1 << 0,
  kCapWrite      = 1 << 1,
  kCapWriteNoRsp = 1 << 2,
  kCapNotify     = 1 << 3,
};

enum class ServiceId : uint8_t { Battery, DeviceInformation, Hid, Count };

enum class AttrId : uint8_t {
  BatteryLevel,
  Status,
  Manufacturer,
  ModelNumber,
  HidInformation,
  ReportMap,
  HidControlPoint,
  ProtocolMode,
  InputReport,
  Count
};

namespace gatt_uuid {
constexpr uint16_t kBatteryService      = 0x180F;
constexpr uint16_t kDeviceInfoService   = 0x180A;
constexpr uint16_t kHidService          = 0x1812;
constexpr uint16_t kBatteryLevel        = 0x2A19;
constexpr uint16_t kManufacturerName    = 0x2A29;
constexpr uint16_t kModelNumber         = 0x2A24;
constexpr uint16_t kHidInformation      = 0x2A4A;
constexpr uint16_t kReportMap           = 0x2A4B;
constexpr uint16_t kHidControlPoint     = 0x2A4C;
constexpr uint16_t kReport              = 0x2A4D;
constexpr uint16_t kProtocolMode        = 0x2A4E;
constexpr uint16_t kUserDescription     = 0x2901;
constexpr uint16_t kValidRange          = 0x2906;
constexpr uint16_t kReportReference     = 0x2908;
constexpr char     kStatusCharacteristic[] = "408813df-5dd4-1f87-ec11-cdb001100000";
}  // namespace gatt_uuid

constexpr uint16_t kAppearanceHidKeyboard = 0x03C1;

struct GattDescriptor {
  static constexpr size_t kMaxLen = 16;
  GattUuid uuid;
  uint16_t handle = 0;
  uint8_t  value[kMaxLen] = {};
  uint8_t  len = 0;
};

struct GattAttribute {
  static constexpr size_t kMaxLen         = 40;
  static constexpr size_t kMaxDescriptors = 2;

  AttrId      id      = AttrId::Count;
  ServiceId   service = ServiceId::Count;
  const char* name    = "";
  GattUuid    uuid;
  uint8_t     caps    = 0;
  uint16_t    handle  = 0;  // value handle
  uint8_t     value[kMaxLen] = {};
  uint8_t     len     = 0;
  uint8_t     minWriteLen = 0;
  uint8_t     maxWriteLen = 0;
  GattDescriptor descriptors[kMaxDescriptors];
  uint8_t     descriptorCount = 0;

  bool can(uint8_t cap) const { return (caps & cap) != 0; }
};

class GattTable {
public:
  static constexpr size_t kAttrCount    = (size_t)AttrId::Count;
  static constexpr size_t kServiceCount = (size_t)ServiceId::Count;

  struct Identity {
    const char* manufacturer = "RatLabs";
    const char* model        = "SVK-1.0";
  };

  // Populates the schema and assigns provisional handles in ATT database
  // order. The host adapter replaces them with the real ones after
  // registration via bindHandle()/bindDescriptorHandle().
  void build(const Identity& identity);

  static GattUuid serviceUuid(ServiceId service);
  static const char* serviceName(ServiceId service);

  GattAttribute& at(AttrId id) { return _attrs[(size_t)id]; }
  const GattAttribute& at(AttrId id) const { return _attrs[(size_t)id]; }
  uint16_t handle(AttrId id) const { return at(id).handle; }

  void bindHandle(AttrId id, uint16_t handle) { at(id).handle = handle; }
  void bindDescriptorHandle(AttrId id, uint8_t index, uint16_t handle);

  // Value handle lookup; descriptors are matched too when owner is given.
  const GattAttribute* findByHandle(uint16_t handle) const;
  const GattDescriptor* findDescriptor(uint16_t handle, const GattAttribute** owner = nullptr) const;
  const char* nameForHandle(uint16_t handle) const;

  // Local update (battery level, status). No capability checks.
  bool set(AttrId id, const uint8_t* data, size_t len);
  bool setByte(AttrId id, uint8_t v) { return set(id, &v, 1); }
  uint8_t byteValue(AttrId id) const { return at(id).len ? at(id).value[0] : 0; }

  // Peer write against a characteristic value handle.
  AttError write(uint16_t handle, const uint8_t* data, size_t len);
  // Current value of a characteristic or descriptor handle.
  bool read(uint16_t handle, const uint8_t*& data, size_t& len) const;

private:
  GattAttribute& define(AttrId id, ServiceId service, const char* name, const GattUuid& uuid,
                        uint8_t caps, const uint8_t* value, size_t len);
  void addDescriptor(GattAttribute& attr, uint16_t uuid16, const uint8_t* value, size_t len);
  void assignProvisionalHandles();

  GattAttribute _attrs[kAttrCount];
};
