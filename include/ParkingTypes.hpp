#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace autopark
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // (level - 1) * spaces_per_level + position, both 1-based
    using SpaceId = uint32_t;

    enum class VehicleClass : uint8_t
    {
        Car = 0,
        Suv = 1,
        Truck = 2,
        Motorcycle = 3
    };

    enum class SpaceClass : uint8_t
    {
        Standard = 0,
        Motorcycle = 1,
        Truck = 2
    };

    enum class PaymentMethod : uint8_t
    {
        None = 0,
        Cash,
        CreditCard,
        DebitCard,
        MobilePay,
        RfidCard
    };

    inline bool spaceAccepts(SpaceClass space, VehicleClass vehicle)
    {
        switch (vehicle)
        {
        case VehicleClass::Motorcycle:
            return space == SpaceClass::Motorcycle || space == SpaceClass::Standard;
        case VehicleClass::Car:
        case VehicleClass::Suv:
            return space == SpaceClass::Standard;
        case VehicleClass::Truck:
            return space == SpaceClass::Truck || space == SpaceClass::Standard;
        }
        return false;
    }

    inline const char *toString(VehicleClass vehicle_class)
    {
        switch (vehicle_class)
        {
        case VehicleClass::Car:
            return "car";
        case VehicleClass::Suv:
            return "suv";
        case VehicleClass::Truck:
            return "truck";
        case VehicleClass::Motorcycle:
            return "motorcycle";
        }
        return "car";
    }

    inline bool vehicleClassFromString(const std::string &value, VehicleClass &vehicle_class)
    {
        if (value == "car")
        {
            vehicle_class = VehicleClass::Car;
            return true;
        }
        if (value == "suv")
        {
            vehicle_class = VehicleClass::Suv;
            return true;
        }
        if (value == "truck")
        {
            vehicle_class = VehicleClass::Truck;
            return true;
        }
        if (value == "motorcycle")
        {
            vehicle_class = VehicleClass::Motorcycle;
            return true;
        }
        return false;
    }

    inline const char *toString(SpaceClass space_class)
    {
        switch (space_class)
        {
        case SpaceClass::Standard:
            return "standard";
        case SpaceClass::Motorcycle:
            return "motorcycle";
        case SpaceClass::Truck:
            return "truck";
        }
        return "standard";
    }

    inline const char *toString(PaymentMethod method)
    {
        switch (method)
        {
        case PaymentMethod::None:
            return "";
        case PaymentMethod::Cash:
            return "cash";
        case PaymentMethod::CreditCard:
            return "credit_card";
        case PaymentMethod::DebitCard:
            return "debit_card";
        case PaymentMethod::MobilePay:
            return "mobile_pay";
        case PaymentMethod::RfidCard:
            return "rfid_card";
        }
        return "";
    }

    inline PaymentMethod paymentMethodFromString(const std::string &value)
    {
        for (PaymentMethod method : {PaymentMethod::Cash, PaymentMethod::CreditCard, PaymentMethod::DebitCard,
                                     PaymentMethod::MobilePay, PaymentMethod::RfidCard})
        {
            if (value == toString(method))
            {
                return method;
            }
        }
        return PaymentMethod::None;
    }

    inline double secondsBetween(TimePoint from, TimePoint to)
    {
        return std::chrono::duration<double>(to - from).count();
    }

    inline int64_t toUnixMillis(TimePoint tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    inline TimePoint fromUnixMillis(int64_t millis)
    {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
    }

} // namespace autopark
