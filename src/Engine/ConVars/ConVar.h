#pragma once
// Copyright (c) 2011, PG & 2025, WH, All rights reserved.
#ifndef CONVAR_H
#define CONVAR_H

#include "BaseEnvironment.h"

#include <string>
#include <string_view>
#include <type_traits>

namespace cv {
enum CvarFlags : u8 {
    // can be set by the user (console, config files, launch args)
    CLIENT = (1 << 0),
    // affects gameplay results
    GAMEPLAY = (1 << 1),
    // don't show in listcommands/find
    HIDDEN = (1 << 2),
    // don't write to config files
    NOSAVE = (1 << 3),
    // ignore when read from config files
    NOLOAD = (1 << 4),
};
}  // namespace cv

enum class CONVAR_TYPE : u8 { BOOL, INT, FLOAT, STRING };

class ConVar {
   public:
    // freestanding/static callbacks only (captureless lambdas are fine)
    using VoidCB = void (*)();
    using ArgsCB = void (*)(std::string_view args);
    using FloatCB = void (*)(float newValue);

    static std::string_view typeToString(CONVAR_TYPE type);

    // commands
    explicit ConVar(std::string_view name);
    ConVar(std::string_view name, u8 flags);
    ConVar(std::string_view name, u8 flags, VoidCB callback);
    ConVar(std::string_view name, u8 flags, ArgsCB callback);

    // variables
    template <typename T>
    ConVar(std::string_view name, T defaultValue, u8 flags, std::string_view helpString = "",
           FloatCB callback = nullptr)
        : sName(name), sHelpString(helpString), changeCallback(callback), iFlags(flags), bCanHaveValue(true) {
        this->initValue(defaultValue);
        this->registerSelf();
    }

    template <typename T>
    ConVar(std::string_view name, T defaultValue, u8 flags, FloatCB callback)
        : ConVar(name, defaultValue, flags, "", callback) {}

    ~ConVar() = default;

    ConVar(const ConVar &) = delete;
    ConVar &operator=(const ConVar &) = delete;
    ConVar(ConVar &&) = delete;
    ConVar &operator=(ConVar &&) = delete;

    // execute commands
    void exec();
    void execArgs(std::string_view args);
    void execFloat(float args);

    // set
    // returns false (and leaves the value untouched) if the string can't be parsed for this type
    bool setValue(std::string_view sValue);
    void setValue(f64 dValue);
    void resetDefaults();

    // get
    [[nodiscard]] inline bool getBool() const { return this->dValue > 0.0; }
    [[nodiscard]] inline int getInt() const { return static_cast<int>(this->dValue); }
    [[nodiscard]] inline float getFloat() const { return static_cast<float>(this->dValue); }
    [[nodiscard]] inline f64 getDouble() const { return this->dValue; }
    [[nodiscard]] inline const std::string &getString() const { return this->sValue; }

    [[nodiscard]] inline const std::string &getDefaultString() const { return this->sDefaultValue; }

    [[nodiscard]] inline const char *getName() const { return this->sName.c_str(); }
    [[nodiscard]] inline const std::string &getHelpstring() const { return this->sHelpString; }
    [[nodiscard]] inline CONVAR_TYPE getType() const { return this->type; }
    [[nodiscard]] inline u8 getFlags() const { return this->iFlags; }

    [[nodiscard]] inline bool isFlagSet(u8 flag) const { return (this->iFlags & flag) == flag; }
    [[nodiscard]] inline bool canHaveValue() const { return this->bCanHaveValue; }
    [[nodiscard]] bool isDefault() const;

   private:
    template <typename T>
    void initValue(T defaultValue) {
        using U = std::decay_t<T>;
        if constexpr(std::is_same_v<U, bool>) {
            this->type = CONVAR_TYPE::BOOL;
            this->initNumeric(defaultValue ? 1.0 : 0.0);
        } else if constexpr(std::is_integral_v<U> || std::is_enum_v<U>) {
            this->type = CONVAR_TYPE::INT;
            this->initNumeric(static_cast<f64>(defaultValue));
        } else if constexpr(std::is_floating_point_v<U>) {
            this->type = CONVAR_TYPE::FLOAT;
            this->initNumeric(static_cast<f64>(defaultValue));
        } else {
            static_assert(std::is_convertible_v<U, std::string_view>, "unsupported ConVar default value type");
            this->type = CONVAR_TYPE::STRING;
            this->initString(std::string_view{defaultValue});
        }
    }

    void initNumeric(f64 value);
    void initString(std::string_view value);
    void registerSelf();

    // applies the value and fires the change callback
    void applyValue(f64 dValue, std::string sValue);
    [[nodiscard]] std::string numericToString(f64 value) const;

    std::string sName;
    std::string sHelpString;

    std::string sValue;
    std::string sDefaultValue;
    f64 dValue{0.0};
    f64 dDefaultValue{0.0};

    VoidCB voidCallback{nullptr};
    ArgsCB argsCallback{nullptr};
    FloatCB changeCallback{nullptr};

    CONVAR_TYPE type{CONVAR_TYPE::FLOAT};
    u8 iFlags{0};
    bool bCanHaveValue{false};
};

#include "ConVarDefs.h"

#endif
