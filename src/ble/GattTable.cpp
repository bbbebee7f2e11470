// File Overview: Builds the Battery, Device Information and HID services the
// knob exposes and answers handle lookups, local updates and peer writes.
#include "ble/GattTable.hpp"

#include <string.h>

#include "hid/KeyState.hpp"

namespace {

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

const uint8_t kHidInfoValue[]      = {0x01, 0x01, 0x00, 0x03};  // bcdHID 1.01, country 0, remote wake + normally connectable
const uint8_t kBatteryValidRange[] = {0, 100};
const char    kBatteryLevelLabel[] = "Battery Level";

}  // namespace

GattUuid GattUuid::from16(uint16_t uuid16) {
  GattUuid u;
  u.len = 2;
  u.bytes[0] = (uint8_t)(uuid16 & 0xFF);
  u.bytes[1] = (uint8_t)(uuid16 >> 8);
  return u;
}

bool GattUuid::parse128(const char* text, GattUuid& out) {
  if (!text) return false;
  uint8_t be[16];
  size_t n = 0;
  for (const char* p = text; *p; ++p) {
    if (*p == '-') continue;
    int hi = hexNibble(*p);
    if (hi < 0 || !p[1]) return false;
    int lo = hexNibble(*++p);
    if (lo < 0 || n >= sizeof(be)) return false;
    be[n++] = (uint8_t)((hi << 4) | lo);
  }
  if (n != sizeof(be)) return false;
  out.len = 16;
  for (size_t i = 0; i < 16; ++i) out.bytes[i] = be[15 - i];
  return true;
}

GattUuid GattTable::serviceUuid(ServiceId service) {
  switch (service) {
    case ServiceId::Battery:           return GattUuid::from16(gatt_uuid::kBatteryService);
    case ServiceId::DeviceInformation: return GattUuid::from16(gatt_uuid::kDeviceInfoService);
    case ServiceId::Hid:               return GattUuid::from16(gatt_uuid::kHidService);
    case ServiceId::Count:             break;
  }
  return GattUuid{};
}

const char* GattTable::serviceName(ServiceId service) {
  switch (service) {
    case ServiceId::Battery:           return "battery";
    case ServiceId::DeviceInformation: return "device-info";
    case ServiceId::Hid:               return "hid";
    case ServiceId::Count:             break;
  }
  return "?";
}

GattAttribute& GattTable::define(AttrId id, ServiceId service, const char* name,
                                 const GattUuid& uuid, uint8_t caps,
                                 const uint8_t* value, size_t len) {
  GattAttribute& a = at(id);
  a = GattAttribute{};
  a.id      = id;
  a.service = service;
  a.name    = name;
  a.uuid    = uuid;
  a.caps    = caps;
  if (value && len) {
    a.len = (uint8_t)(len > GattAttribute::kMaxLen ? GattAttribute::kMaxLen : len);
    memcpy(a.value, value, a.len);
  }
  a.minWriteLen = a.len;
  a.maxWriteLen = a.len;
  return a;
}

void GattTable::addDescriptor(GattAttribute& attr, uint16_t uuid16, const uint8_t* value, size_t len) {
  if (attr.descriptorCount >= GattAttribute::kMaxDescriptors) return;
  GattDescriptor& d = attr.descriptors[attr.descriptorCount++];
  d.uuid = GattUuid::from16(uuid16);
  d.len  = (uint8_t)(len > GattDescriptor::kMaxLen ? GattDescriptor::kMaxLen : len);
  memcpy(d.value, value, d.len);
}

void GattTable::build(const Identity& identity) {
  const uint8_t level = 100;
  GattAttribute& battery = define(AttrId::BatteryLevel, ServiceId::Battery, "battery-level",
                                  GattUuid::from16(gatt_uuid::kBatteryLevel),
                                  kCapRead | kCapNotify, &level, 1);
  addDescriptor(battery, gatt_uuid::kValidRange, kBatteryValidRange, sizeof(kBatteryValidRange));
  addDescriptor(battery, gatt_uuid::kUserDescription,
                reinterpret_cast<const uint8_t*>(kBatteryLevelLabel), sizeof(kBatteryLevelLabel) - 1);

  GattUuid statusUuid;
  GattUuid::parse128(gatt_uuid::kStatusCharacteristic, statusUuid);
  const uint8_t status = 0;
  define(AttrId::Status, ServiceId::Battery, "status", statusUuid,
         kCapRead | kCapWrite | kCapNotify, &status, 1);

  const char* manufacturer = identity.manufacturer ? identity.manufacturer : "";
  const char* model        = identity.model ? identity.model : "";
  define(AttrId::Manufacturer, ServiceId::DeviceInformation, "manufacturer",
         GattUuid::from16(gatt_uuid::kManufacturerName), kCapRead,
         reinterpret_cast<const uint8_t*>(manufacturer), strlen(manufacturer));
  define(AttrId::ModelNumber, ServiceId::DeviceInformation, "model-number",
         GattUuid::from16(gatt_uuid::kModelNumber), kCapRead,
         reinterpret_cast<const uint8_t*>(model), strlen(model));

  define(AttrId::HidInformation, ServiceId::Hid, "hid-info",
         GattUuid::from16(gatt_uuid::kHidInformation), kCapRead,
         kHidInfoValue, sizeof(kHidInfoValue));
  define(AttrId::ReportMap, ServiceId::Hid, "report-map",
         GattUuid::from16(gatt_uuid::kReportMap), kCapRead,
         kHidReportMap, kHidReportMapLen);
  const uint8_t control = 0;
  define(AttrId::HidControlPoint, ServiceId::Hid, "hid-control-point",
         GattUuid::from16(gatt_uuid::kHidControlPoint), kCapWriteNoRsp, &control, 1);
  const uint8_t reportProtocol = 1;
  define(AttrId::ProtocolMode, ServiceId::Hid, "protocol-mode",
         GattUuid::from16(gatt_uuid::kProtocolMode), kCapRead | kCapWriteNoRsp,
         &reportProtocol, 1);
  const InputReport idle = asReport(KeyState::None);
  GattAttribute& input = define(AttrId::InputReport, ServiceId::Hid, "input-report",
                                GattUuid::from16(gatt_uuid::kReport), kCapRead | kCapNotify,
                                idle.bytes, sizeof(idle.bytes));
  const uint8_t reportRef[] = {0x00, kHidReportTypeInput};
  addDescriptor(input, gatt_uuid::kReportReference, reportRef, sizeof(reportRef));

  assignProvisionalHandles();
}

void GattTable::assignProvisionalHandles() {
  uint16_t next = 1;
  for (size_t s = 0; s < kServiceCount; ++s) {
    ++next;  // service declaration
    for (size_t i = 0; i < kAttrCount; ++i) {
      GattAttribute& a = _attrs[i];
      if ((size_t)a.service != s) continue;
      ++next;  // characteristic declaration
      a.handle = next++;
      if (a.can(kCapNotify)) ++next;  // CCCD
      for (uint8_t d = 0; d < a.descriptorCount; ++d) {
        a.descriptors[d].handle = next++;
      }
    }
  }
}

void GattTable::bindDescriptorHandle(AttrId id, uint8_t index, uint16_t handle) {
  GattAttribute& a = at(id);
  if (index < a.descriptorCount) a.descriptors[index].handle = handle;
}

const GattAttribute* GattTable::findByHandle(uint16_t handle) const {
  if (handle == 0) return nullptr;
  for (const GattAttribute& a : _attrs) {
    if (a.handle == handle) return &a;
  }
  return nullptr;
}

const GattDescriptor* GattTable::findDescriptor(uint16_t handle, const GattAttribute** owner) const {
  if (handle == 0) return nullptr;
  for (const GattAttribute& a : _attrs) {
    for (uint8_t d = 0; d < a.descriptorCount; ++d) {
      if (a.descriptors[d].handle == handle) {
        if (owner) *owner = &a;
        return &a.descriptors[d];
      }
    }
  }
  return nullptr;
}

const char* GattTable::nameForHandle(uint16_t handle) const {
  if (const GattAttribute* a = findByHandle(handle)) return a->name;
  const GattAttribute* owner = nullptr;
  if (findDescriptor(handle, &owner) && owner) return owner->name;
  return "unknown";
}

bool GattTable::set(AttrId id, const uint8_t* data, size_t len) {
  if (id == AttrId::Count || len > GattAttribute::kMaxLen || (len && !data)) return false;
  GattAttribute& a = at(id);
  if (len) memcpy(a.value, data, len);
  a.len = (uint8_t)len;
  return true;
}

AttError GattTable::write(uint16_t handle, const uint8_t* data, size_t len) {
  const GattAttribute* found = findByHandle(handle);
  if (!found) {
    return findDescriptor(handle) ? AttError::WriteNotPermitted : AttError::InvalidHandle;
  }
  GattAttribute& a = at(found->id);
  if (!a.can(kCapWrite) && !a.can(kCapWriteNoRsp)) return AttError::WriteNotPermitted;
  if (len < a.minWriteLen || len > a.maxWriteLen || (len && !data)) {
    return AttError::InvalidAttributeValueLength;
  }
  if (len) memcpy(a.value, data, len);
  a.len = (uint8_t)len;
  return AttError::None;
}

bool GattTable::read(uint16_t handle, const uint8_t*& data, size_t& len) const {
  if (const GattAttribute* a = findByHandle(handle)) {
    data = a->value;
    len  = a->len;
    return true;
  }
  if (const GattDescriptor* d = findDescriptor(handle)) {
    data = d->value;
    len  = d->len;
    return true;
  }
  return false;
}
