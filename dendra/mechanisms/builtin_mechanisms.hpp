#pragma once

#include <dendra/mechanism.hpp>

namespace dendra {

// Hodgkin-Huxley sodium, potassium and leak currents.
//   parameters: gna, gk, gl [mS/cm²]; ena, ek, el [mV]
//   state:      m, h, n
channel_ptr make_hh_channel();

// Passive leak.
//   parameters: g [mS/cm²]; e [mV]
channel_ptr make_pas_channel();

// Glutamatergic synapse with sigmoidal presynaptic activation.
//   parameters: gs [mS/cm²]; e_syn, v_th, delta [mV]; k_minus [1/ms]
//   state:      s
synapse_ptr make_glutamate_synapse();

} // namespace dendra
