#pragma once
#include <stdint.h>
#include <string>

struct LoggingConfig {
    std::string log_level;
    bool flush_on_write;
};

struct AcquisitionConfig {
    uint32_t period_ms;
    uint32_t duration_ms;          // 0 = run until stopped
    uint16_t max_samples;
    uint8_t adc_pin;
    uint8_t step_pin;
    uint8_t adc_resolution_bits;
    float vref_volts;
    uint32_t adc_read_budget_us;   // a slower conversion counts as a dropped sample
};

struct ConfigValidationRules {
    uint32_t min_period_ms = 1;
    uint32_t max_period_ms = 60000;
    uint32_t max_duration_ms = 3600000;   // 1 hour
    uint16_t min_samples = 1;
    uint16_t max_samples = 4096;
    uint8_t min_resolution_bits = 8;
    uint8_t max_resolution_bits = 16;
    float max_vref_volts = 5.5f;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    AcquisitionConfig getAcquisitionConfig() const;
    LoggingConfig getLoggingConfig() const;
    ConfigValidationRules getValidationRules() const;

    bool validateSamplingInterval(uint32_t period_ms, std::string& reason) const;
    bool validateDuration(uint32_t duration_ms, uint32_t period_ms, std::string& reason) const;
    bool validateCapacity(uint32_t max_samples, std::string& reason) const;
    bool validateAdc(uint32_t resolution_bits, float vref_volts, std::string& reason) const;
    bool validateReadBudget(uint32_t budget_us, uint32_t period_ms, std::string& reason) const;
    // Period and duration typed on the serial line for one step test. The
    // duration must be bounded.
    bool validateStepRequest(long period_ms, long duration_ms, std::string& reason) const;

    // Applies overrides from a JSON document of the form
    // {"acquisition": {...}, "logging": {...}}. Either every override is
    // applied or none is; reason explains the first rejected field.
    bool loadFromJson(const std::string& json, std::string& reason);
    std::string toJson() const;

    void setSamplingInterval(uint32_t period_ms);
    void setDuration(uint32_t duration_ms);

private:
    AcquisitionConfig acquisition_config_;
    LoggingConfig logging_config_;
    ConfigValidationRules validation_rules_;

    void initializeDefaults();
    bool validateAcquisition(const AcquisitionConfig& cfg, std::string& reason) const;
};
