#pragma once

// ======================= Rotary Encoder =======================
#define PIN_ENC_A       2
#define PIN_ENC_B       1
#define PIN_ENC_BUTTON  44   // -1 when the knob has no push switch

// ======================= Battery sense =======================
// Divider midpoint (2:1) on an ADC1 pin; -1 reports a fixed 100 %.
#define PIN_BATT_SENSE  4
#define BATT_DIVIDER    2
