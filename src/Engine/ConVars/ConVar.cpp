// Copyright (c) 2011, PG & 2025, WH, All rights reserved.
#include "ConVar.h"

#include "ConVarHandler.h"
#include "Logging.h"
#include "SString.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

std::string_view ConVar::typeToString(CONVAR_TYPE type) {
    switch(type) {
        case CONVAR_TYPE::BOOL:
            return "bool";
        case CONVAR_TYPE::INT:
            return "int";
        case CONVAR_TYPE::FLOAT:
            return "float";
        case CONVAR_TYPE::STRING:
            return "string";
    }
    return "";
}

ConVar::ConVar(std::string_view name) : sName(name) { this->registerSelf(); }

ConVar::ConVar(std::string_view name, u8 flags) : sName(name), iFlags(flags) { this->registerSelf(); }

ConVar::ConVar(std::string_view name, u8 flags, VoidCB callback)
    : sName(name), voidCallback(callback), iFlags(flags) {
    this->registerSelf();
}

ConVar::ConVar(std::string_view name, u8 flags, ArgsCB callback)
    : sName(name), argsCallback(callback), iFlags(flags) {
    this->registerSelf();
}

void ConVar::registerSelf() { cvars().addConVar(this); }

void ConVar::initNumeric(f64 value) {
    this->dValue = this->dDefaultValue = value;
    this->sValue = this->sDefaultValue = this->numericToString(value);
}

void ConVar::initString(std::string_view value) {
    this->sValue = this->sDefaultValue = std::string{value};
    this->dValue = this->dDefaultValue = SString::to_double(value).value_or(0.0);
}

std::string ConVar::numericToString(f64 value) const {
    switch(this->type) {
        case CONVAR_TYPE::BOOL:
            return value > 0.0 ? "1" : "0";
        case CONVAR_TYPE::INT:
            return fmt::format("{}", static_cast<i64>(value));
        default:
            return fmt::format("{:g}", value);
    }
}

void ConVar::exec() {
    if(this->voidCallback) this->voidCallback();
}

void ConVar::execArgs(std::string_view args) {
    if(this->argsCallback) this->argsCallback(args);
}

void ConVar::execFloat(float args) {
    if(this->changeCallback) this->changeCallback(args);
}

bool ConVar::setValue(std::string_view sValue) {
    if(!this->bCanHaveValue) {
        // commands take the value as their argument
        this->execArgs(sValue);
        return true;
    }

    SString::trim_inplace(sValue);

    switch(this->type) {
        case CONVAR_TYPE::STRING: {
            this->applyValue(SString::to_double(sValue).value_or(0.0), std::string{sValue});
            return true;
        }
        case CONVAR_TYPE::BOOL: {
            const auto parsed = SString::to_bool(sValue);
            if(!parsed.has_value()) break;
            this->applyValue(parsed.value() ? 1.0 : 0.0, parsed.value() ? "1" : "0");
            return true;
        }
        case CONVAR_TYPE::INT: {
            const auto parsed = SString::to_int(sValue);
            if(!parsed.has_value() || parsed.value() < std::numeric_limits<int>::min() ||
               parsed.value() > std::numeric_limits<int>::max())
                break;
            this->setValue(static_cast<f64>(parsed.value()));
            return true;
        }
        case CONVAR_TYPE::FLOAT: {
            const auto parsed = SString::to_double(sValue);
            if(!parsed.has_value() || !std::isfinite(parsed.value())) break;
            this->setValue(parsed.value());
            return true;
        }
    }

    debugLog("can't set {:s} ({:s}) to \"{:s}\"", this->sName, typeToString(this->type), sValue);
    return false;
}

void ConVar::setValue(f64 dValue) {
    if(!this->bCanHaveValue) return;

    switch(this->type) {
        case CONVAR_TYPE::BOOL:
            dValue = dValue > 0.0 ? 1.0 : 0.0;
            break;
        case CONVAR_TYPE::INT:
            if(!std::isfinite(dValue)) return;
            // getInt() must always be able to represent it
            dValue = std::clamp(std::trunc(dValue), (f64)std::numeric_limits<int>::min(),
                                (f64)std::numeric_limits<int>::max());
            break;
        default:
            break;
    }

    this->applyValue(dValue, this->type == CONVAR_TYPE::STRING ? fmt::format("{:g}", dValue)
                                                                : this->numericToString(dValue));
}

void ConVar::resetDefaults() {
    if(!this->bCanHaveValue) return;
    this->applyValue(this->dDefaultValue, this->sDefaultValue);
}

void ConVar::applyValue(f64 dValue, std::string sValue) {
    const bool changed = this->sValue != sValue;

    this->dValue = dValue;
    this->sValue = std::move(sValue);

    if(changed) {
        logIfCV(debug_cv, "{:s} = {:s}", this->sName, this->sValue);
        this->execFloat(static_cast<float>(this->dValue));
    }
}

bool ConVar::isDefault() const {
    if(this->type == CONVAR_TYPE::STRING) return this->sValue == this->sDefaultValue;
    return this->dValue == this->dDefaultValue;
}
