#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>

ConfigManager::ConfigManager() {
    initializeDefaults();
}

void ConfigManager::initializeDefaults() {
    // 100 Hz for 2 s fills the 200-sample queue exactly
    acquisition_config_.period_ms = 10;
    acquisition_config_.duration_ms = 2000;
    acquisition_config_.max_samples = 200;
    acquisition_config_.adc_pin = 36;   // ESP32 GPIO36 (VP), ADC1
    acquisition_config_.step_pin = 25;
    acquisition_config_.adc_resolution_bits = 12;
    acquisition_config_.vref_volts = 3.3f;
    acquisition_config_.adc_read_budget_us = 1000;

    logging_config_.log_level = "INFO";
    logging_config_.flush_on_write = true;
}

ConfigManager::~ConfigManager() {}

AcquisitionConfig ConfigManager::getAcquisitionConfig() const { return acquisition_config_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
ConfigValidationRules ConfigManager::getValidationRules() const { return validation_rules_; }

bool ConfigManager::validateSamplingInterval(uint32_t period_ms, std::string& reason) const {
    if (period_ms < validation_rules_.min_period_ms) {
        reason = "Sampling interval too low (min: " +
                 std::to_string(validation_rules_.min_period_ms) + " ms)";
        return false;
    }
    if (period_ms > validation_rules_.max_period_ms) {
        reason = "Sampling interval too high (max: " +
                 std::to_string(validation_rules_.max_period_ms) + " ms)";
        return false;
    }
    return true;
}

bool ConfigManager::validateDuration(uint32_t duration_ms, uint32_t period_ms, std::string& reason) const {
    if (duration_ms == 0) return true;
    if (duration_ms < period_ms) {
        reason = "Duration shorter than one sampling interval (" +
                 std::to_string(duration_ms) + " < " + std::to_string(period_ms) + " ms)";
        return false;
    }
    if (duration_ms > validation_rules_.max_duration_ms) {
        reason = "Duration too long (max: " +
                 std::to_string(validation_rules_.max_duration_ms) + " ms)";
        return false;
    }
    return true;
}

bool ConfigManager::validateCapacity(uint32_t max_samples, std::string& reason) const {
    if (max_samples < validation_rules_.min_samples || max_samples > validation_rules_.max_samples) {
        reason = "Sample capacity out of range (" + std::to_string(validation_rules_.min_samples) +
                 "-" + std::to_string(validation_rules_.max_samples) + ")";
        return false;
    }
    return true;
}

bool ConfigManager::validateAdc(uint32_t resolution_bits, float vref_volts, std::string& reason) const {
    if (resolution_bits < validation_rules_.min_resolution_bits ||
        resolution_bits > validation_rules_.max_resolution_bits) {
        reason = "ADC resolution out of range (" + std::to_string(validation_rules_.min_resolution_bits) +
                 "-" + std::to_string(validation_rules_.max_resolution_bits) + " bits)";
        return false;
    }
    if (!(vref_volts > 0.0f) || vref_volts > validation_rules_.max_vref_volts) {
        reason = "Reference voltage out of range (0-" +
                 std::to_string(validation_rules_.max_vref_volts) + " V)";
        return false;
    }
    return true;
}

bool ConfigManager::validateReadBudget(uint32_t budget_us, uint32_t period_ms, std::string& reason) const {
    if (budget_us == 0 || budget_us > period_ms * 1000UL) {
        reason = "ADC read budget must be within one sampling interval (1-" +
                 std::to_string(period_ms * 1000UL) + " us)";
        return false;
    }
    return true;
}

bool ConfigManager::validateStepRequest(long period_ms, long duration_ms, std::string& reason) const {
    if (period_ms <= 0) {
        reason = "Sampling interval must be positive";
        return false;
    }
    if (duration_ms <= 0) {
        reason = "A step test needs a positive duration";
        return false;
    }
    // Range-check before narrowing to uint32_t
    if ((unsigned long)period_ms > validation_rules_.max_period_ms) {
        reason = "Sampling interval too high (max: " +
                 std::to_string(validation_rules_.max_period_ms) + " ms)";
        return false;
    }
    if ((unsigned long)duration_ms > validation_rules_.max_duration_ms) {
        reason = "Duration too long (max: " +
                 std::to_string(validation_rules_.max_duration_ms) + " ms)";
        return false;
    }
    return validateSamplingInterval((uint32_t)period_ms, reason) &&
           validateDuration((uint32_t)duration_ms, (uint32_t)period_ms, reason);
}

bool ConfigManager::validateAcquisition(const AcquisitionConfig& cfg, std::string& reason) const {
    return validateSamplingInterval(cfg.period_ms, reason) &&
           validateDuration(cfg.duration_ms, cfg.period_ms, reason) &&
           validateCapacity(cfg.max_samples, reason) &&
           validateAdc(cfg.adc_resolution_bits, cfg.vref_volts, reason) &&
           validateReadBudget(cfg.adc_read_budget_us, cfg.period_ms, reason);
}

// Reads a non-negative integer field; leaves out untouched when the key is absent.
static bool readUnsigned(JsonObjectConst obj, const char* key, uint32_t& out, std::string& reason) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<long>() || v.as<long>() < 0) {
        reason = std::string("Field '") + key + "' must be a non-negative integer";
        return false;
    }
    out = (uint32_t)v.as<long>();
    return true;
}

bool ConfigManager::loadFromJson(const std::string& json, std::string& reason) {
    DynamicJsonDocument doc(1024);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        reason = std::string("Failed to parse config JSON: ") + error.c_str();
        Logger::error("[Config] %s", reason.c_str());
        return false;
    }

    AcquisitionConfig acq = acquisition_config_;
    LoggingConfig logging = logging_config_;

    JsonObjectConst acqObj = doc["acquisition"].as<JsonObjectConst>();
    if (!acqObj.isNull()) {
        uint32_t period = acq.period_ms, duration = acq.duration_ms, capacity = acq.max_samples;
        uint32_t adcPin = acq.adc_pin, stepPin = acq.step_pin, bits = acq.adc_resolution_bits;
        uint32_t budget = acq.adc_read_budget_us;
        if (!readUnsigned(acqObj, "period_ms", period, reason) ||
            !readUnsigned(acqObj, "duration_ms", duration, reason) ||
            !readUnsigned(acqObj, "max_samples", capacity, reason) ||
            !readUnsigned(acqObj, "adc_pin", adcPin, reason) ||
            !readUnsigned(acqObj, "step_pin", stepPin, reason) ||
            !readUnsigned(acqObj, "adc_resolution_bits", bits, reason) ||
            !readUnsigned(acqObj, "adc_read_budget_us", budget, reason)) {
            Logger::warn("[Config] Rejected: %s", reason.c_str());
            return false;
        }
        if (adcPin > 255 || stepPin > 255) {
            reason = "Pin numbers must be below 256";
            Logger::warn("[Config] Rejected: %s", reason.c_str());
            return false;
        }
        // Range-check before narrowing so 65536 does not wrap into a valid capacity
        if (!validateCapacity(capacity, reason) || !validateAdc(bits, acq.vref_volts, reason)) {
            Logger::warn("[Config] Rejected: %s", reason.c_str());
            return false;
        }
        JsonVariantConst vref = acqObj["vref_volts"];
        if (!vref.isNull()) {
            if (!vref.is<float>()) {
                reason = "Field 'vref_volts' must be a number";
                Logger::warn("[Config] Rejected: %s", reason.c_str());
                return false;
            }
            acq.vref_volts = vref.as<float>();
        }
        acq.period_ms = period;
        acq.duration_ms = duration;
        acq.max_samples = (uint16_t)capacity;
        acq.adc_pin = (uint8_t)adcPin;
        acq.step_pin = (uint8_t)stepPin;
        acq.adc_resolution_bits = (uint8_t)bits;
        acq.adc_read_budget_us = budget;
    }

    JsonObjectConst logObj = doc["logging"].as<JsonObjectConst>();
    if (!logObj.isNull()) {
        JsonVariantConst level = logObj["log_level"];
        if (!level.isNull()) {
            Logger::Level parsed;
            if (!level.is<const char*>() || !Logger::parseLevel(level.as<const char*>(), parsed)) {
                reason = "Field 'log_level' must be one of DEBUG, INFO, WARN, ERROR";
                Logger::warn("[Config] Rejected: %s", reason.c_str());
                return false;
            }
            logging.log_level = level.as<const char*>();
        }
        JsonVariantConst flush = logObj["flush_on_write"];
        if (!flush.isNull()) {
            if (!flush.is<bool>()) {
                reason = "Field 'flush_on_write' must be a boolean";
                Logger::warn("[Config] Rejected: %s", reason.c_str());
                return false;
            }
            logging.flush_on_write = flush.as<bool>();
        }
    }

    if (!validateAcquisition(acq, reason)) {
        Logger::warn("[Config] Rejected: %s", reason.c_str());
        return false;
    }

    acquisition_config_ = acq;
    logging_config_ = logging;
    Logger::info("[Config] Loaded: period=%lu ms, duration=%lu ms, capacity=%u",
                 (unsigned long)acq.period_ms, (unsigned long)acq.duration_ms, (unsigned)acq.max_samples);
    return true;
}

std::string ConfigManager::toJson() const {
    DynamicJsonDocument doc(512);
    JsonObject acq = doc.createNestedObject("acquisition");
    acq["period_ms"] = acquisition_config_.period_ms;
    acq["duration_ms"] = acquisition_config_.duration_ms;
    acq["max_samples"] = acquisition_config_.max_samples;
    acq["adc_pin"] = acquisition_config_.adc_pin;
    acq["step_pin"] = acquisition_config_.step_pin;
    acq["adc_resolution_bits"] = acquisition_config_.adc_resolution_bits;
    acq["vref_volts"] = acquisition_config_.vref_volts;
    acq["adc_read_budget_us"] = acquisition_config_.adc_read_budget_us;
    JsonObject logging = doc.createNestedObject("logging");
    logging["log_level"] = logging_config_.log_level;
    logging["flush_on_write"] = logging_config_.flush_on_write;
    std::string out;
    serializeJson(doc, out);
    return out;
}

void ConfigManager::setSamplingInterval(uint32_t period_ms) {
    std::string reason;
    if (!validateSamplingInterval(period_ms, reason) ||
        !validateDuration(acquisition_config_.duration_ms, period_ms, reason) ||
        !validateReadBudget(acquisition_config_.adc_read_budget_us, period_ms, reason)) {
        Logger::warn("[Config] Ignoring sampling interval %lu ms: %s", (unsigned long)period_ms, reason.c_str());
        return;
    }
    acquisition_config_.period_ms = period_ms;
}

void ConfigManager::setDuration(uint32_t duration_ms) {
    std::string reason;
    if (!validateDuration(duration_ms, acquisition_config_.period_ms, reason)) {
        Logger::warn("[Config] Ignoring duration %lu ms: %s", (unsigned long)duration_ms, reason.c_str());
        return;
    }
    acquisition_config_.duration_ms = duration_ms;
}
