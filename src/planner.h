// Bling - Systematic Investment Plan (SIP) calculator
//
// Contributions are made at the start of every month (annuity-due), so each
// payment compounds for one extra period compared to an ordinary annuity.

#pragma once

#include <string>

// SipPlan: validated inputs and the derived projection
struct SipPlan {
    double monthly = 0.0;           // contribution per month (P)
    double annualRatePct = 0.0;     // expected annual return in percent
    double years = 0.0;
    int periods = 0;                // floor(years * 12)
    double monthlyRate = 0.0;       // annualRatePct / 100 / 12
    double futureValue = 0.0;
    bool hasGoal = false;
    double goal = 0.0;
    double requiredMonthly = 0.0;   // contribution needed to reach goal
};

int sipPeriods(double years);
double sipMonthlyRate(double annualRatePct);

// sipGrowthFactor: FV of one unit paid monthly, ((1+r)^n - 1)/r * (1+r), or n when r == 0
double sipGrowthFactor(double monthlyRate, int periods);

double sipFutureValue(double monthly, double annualRatePct, double years);
double sipRequiredMonthly(double goal, double annualRatePct, double years);

// tryBuildSipPlan: Validate numeric inputs and compute the plan
// goal is optional (blank text). Fails, without computing anything, when a field is not a
// number, monthly < 0 or years <= 0. Under a month plans zero periods: corpus 0 and no goal line.
bool tryBuildSipPlan(const std::string &monthlyText, const std::string &rateText,
                     const std::string &yearsText, const std::string &goalText, SipPlan &out);
