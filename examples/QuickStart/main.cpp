#include <Propel/Properties/Properties.hpp>

#include <iostream>
#include <string>

namespace Demo {
  using namespace Propel::Properties;

  class Account {
  public:
    int getBalance() const { return balance; }
    void setBalance(int v) { balance = v; }
    std::string getOwner() const { return owner; }
    Observable<double> &rateProperty() { return rate; }

  private:
    int balance{100};
    std::string owner{"ada"};
    SimpleObservable<double> rate{0.02};

    friend void PropelReflect(Tag<Account>, ClassBuilder<Account> &b) {
      b.Field<&Account::balance>();
      b.Method<&Account::getBalance>("getBalance");
      b.Method<&Account::setBalance>("setBalance");
      b.Method<&Account::getOwner>("getOwner");
      b.Method<&Account::rateProperty>("rateProperty");
    }
  };
}

int main() {
  using namespace Propel::Properties;
  using Demo::Account;
  std::cout << "Library: " << LibraryName() << "\n";

  auto registry = RegistryBuilder{}.Build<Account>();
  if (!registry) {
    std::cerr << registry.error().message << "\n";
    return 1;
  }

  for (const auto &[name, descriptor] : (*registry)->Properties())
    std::cout << descriptor->Describe() << "\n";

  Account account{};
  auto balance = (*registry)->GetIntProperty("balance").value();
  (void)balance.Set(account, 250);
  std::cout << "balance => " << balance.Get(account).value() << "\n";

  auto rate = (*registry)->GetDoubleProperty("rate").value();
  (void)rate.Set(account, 0.05);
  std::cout << "rate => " << account.rateProperty().GetValue() << "\n";

  auto owner = (*registry)->Get("owner").value();
  auto rename = owner->SetValue(ObjectRef::Of(account), Any{std::string{"bob"}});
  if (!rename)
    std::cout << "owner => " << rename.error().message << "\n";
  return 0;
}
