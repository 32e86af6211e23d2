class Empty {};
