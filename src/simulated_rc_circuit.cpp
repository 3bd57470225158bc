#include "../include/simulated_rc_circuit.hpp"
#include <cmath>

RcCircuit::RcCircuit(Clock& clock, const AdcConverter& converter, float tau_ms, float high_volts)
    : clock_(clock), converter_(converter), tau_ms_(tau_ms), high_volts_(high_volts),
      start_volts_(0.0f), target_volts_(0.0f), edge_ms_(clock.nowMs()), fail_every_(0), reads_(0) {}

float RcCircuit::voltageNow() {
    uint32_t dt = clock_.nowMs() - edge_ms_;
    if (tau_ms_ <= 0.0f) return target_volts_;
    return target_volts_ + (start_volts_ - target_volts_) * std::exp(-(float)dt / tau_ms_);
}

void RcCircuit::write(bool high) {
    start_volts_ = voltageNow();
    target_volts_ = high ? high_volts_ : 0.0f;
    edge_ms_ = clock_.nowMs();
}

bool RcCircuit::read(uint16_t& outRaw) {
    reads_++;
    if (fail_every_ > 0 && reads_ % fail_every_ == 0) return false;
    outRaw = converter_.toRaw(voltageNow());
    return true;
}
